#include "engine/triangle/solve.hpp"

#include <cstdio>
#include <exception>
#include <sstream>
#include <string>
#include <string_view>

#include "engine/core/logging.hpp"

namespace pythag {
namespace {

int count_filled(const FieldMap& data, const FieldNames& names) noexcept {
  int n = 0;
  for (const std::string* key : {&names.leg_a, &names.leg_b, &names.hypotenuse}) {
    const auto it = data.find(*key);
    if (it != data.end() && !is_blank(it->second)) ++n;
  }
  return n;
}

// Fits the small-string buffer, so assigning it does not allocate.
constexpr const char* kMsgRejectedFallback = "Rejected";

// Flags and code are set before any allocation. If building the text runs out
// of memory the record is still rejected, with a short fixed message.
void reject(TriangleRecord& t, ErrorCode code, const std::string& field,
            std::string_view prefix, std::string_view message) noexcept {
  t.outcome = Outcome::kRejected;
  t.code = code;
  t.is_valid = false;
  t.is_right = false;
  try {
    t.field = field;
    if (message.empty()) {
      t.message = to_string(code);
    } else {
      t.message.assign(prefix);
      t.message.append(message);
    }
  } catch (const std::exception&) {
    t.field.clear();
    t.message = kMsgRejectedFallback;
  }
}

void log_rejection(LogLevel lvl, const char* prefix, const char* what) noexcept {
  try {
    log(lvl, std::string(prefix) + what);
  } catch (const std::exception&) {
    std::fputs("process_fields: rejection not logged (out of memory)\n", stderr);
  }
}

void run_solve_or_verify(TriangleRecord& t, const SolverSettings& s) {
  const int missing = static_cast<int>(!t.a.has_value()) + static_cast<int>(!t.b.has_value()) +
                      static_cast<int>(!t.c.has_value());

  if (missing > 1) {
    PYTHAG_THROW(ErrorCode::kAmbiguousInput, kMsgAmbiguousInput);
  }

  if (missing == 1) {
    if (!t.c.has_value()) {
      log_debug("process_fields: solve, hypotenuse missing");
      t.compute_hypotenuse();
      t.message = kMsgHypotenuseCalculated;
    } else {
      log_debug("process_fields: solve, leg missing");
      t.compute_leg();
      t.message = kMsgLegCalculated;
    }
    t.outcome = Outcome::kComputed;
    return;
  }

  log_debug("process_fields: verify");
  t.normalize();
  t.check_triangle_inequality();
  t.check_right_angle(s.tolerance);
  t.message = t.is_right ? kMsgVerifiedRight : kMsgVerifiedNotRight;
  t.outcome = Outcome::kVerified;
}

}  // namespace

const char* mode_to_string(Mode m) noexcept {
  switch (m) {
    case Mode::kNone:   return "None";
    case Mode::kSolve:  return "Solve";
    case Mode::kVerify: return "Verify";
    default:            return "None";
  }
}

Mode detect_mode(const FieldMap& data, const FieldNames& names) noexcept {
  switch (count_filled(data, names)) {
    case 2:  return Mode::kSolve;
    case 3:  return Mode::kVerify;
    default: return Mode::kNone;
  }
}

TriangleRecord process_fields(const FieldMap& data) noexcept {
  return process_fields(data, SolverSettings::defaults());
}

TriangleRecord process_fields(const FieldMap& data, const SolverSettings& settings) noexcept {
  TriangleRecord t;

  try {
    settings.validate_or_throw();

    const FieldNames& n = settings.fields;
    validate_required_keys(data, n);
    log_debug(std::string("process_fields: mode ") + mode_to_string(detect_mode(data, n)));

    // Field by field so values parsed before a failing field stay on the record.
    t.a = validate_value(n.leg_a, data.at(n.leg_a));
    t.b = validate_value(n.leg_b, data.at(n.leg_b));
    t.c = validate_value(n.hypotenuse, data.at(n.hypotenuse));

    run_solve_or_verify(t, settings);
    t.code = ErrorCode::kOk;

    std::ostringstream oss;
    oss << "process_fields: " << outcome_to_string(t.outcome) << " - " << t.message;
    log_info(oss.str());
  } catch (const Error& e) {
    log_rejection(LogLevel::INFO, "process_fields: rejected - ", e.what());
    reject(t, e.code(), e.field(), {}, e.message());
  } catch (const std::exception& e) {
    log_rejection(LogLevel::ERROR, "process_fields: internal failure - ", e.what());
    reject(t, ErrorCode::kInternal, std::string{}, "Internal error: ", e.what());
  }

  return t;
}

}  // namespace pythag
