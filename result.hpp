#ifndef RESULT_HPP
#define RESULT_HPP

#include <string>
#include <utility>


enum struct ResultCode : int {
  kOk = 0,
  kOpenError = 1,        // Store connection could not be established
  kReadError = 2,        // advance/decode/cursor/timestamp failed, handle still usable
  kSeekError = 3,        // Cursor restore failed (closest seek is NOT an error)
  kWaitError = 4,        // Wait primitive failed
  kInvalidArgument = 5,
  kCorruption = 6,       // Store handed us data that breaks its own contract
  kNotSupported = 7,     // Operation not valid in the current state (e.g. closed handle)
  kIOError = 8,          // Write path failure
  kError = 9             // Generic error
};

class Result {
 public:
  Result() : code_(ResultCode::kOk), native_status_(0), message_("") {}

  // native_status is the negative errno reported by the store, 0 if none.
  Result(ResultCode error_code, std::string error_message, int native_status = 0)
      : code_(error_code),
        native_status_(native_status),
        message_(std::move(error_message)) {}

  Result(const Result& other) = default;
  Result(Result&& other) noexcept = default;
  Result& operator=(const Result& other) = default;
  Result& operator=(Result&& other) noexcept = default;

  ~Result() = default;

  static Result OK() { return Result(); }
  static Result OpenError(std::string message, int native_status = 0) {
    return Result(ResultCode::kOpenError, std::move(message), native_status);
  }
  static Result ReadError(std::string message, int native_status = 0) {
    return Result(ResultCode::kReadError, std::move(message), native_status);
  }
  static Result SeekError(std::string message, int native_status = 0) {
    return Result(ResultCode::kSeekError, std::move(message), native_status);
  }
  static Result WaitError(std::string message, int native_status = 0) {
    return Result(ResultCode::kWaitError, std::move(message), native_status);
  }
  static Result InvalidArgument(std::string message) {
    return Result(ResultCode::kInvalidArgument, std::move(message));
  }
  static Result Corruption(std::string message) {
    return Result(ResultCode::kCorruption, std::move(message));
  }
  static Result NotSupported(std::string message) {
    return Result(ResultCode::kNotSupported, std::move(message));
  }
  static Result IOError(std::string message, int native_status = 0) {
    return Result(ResultCode::kIOError, std::move(message), native_status);
  }
  static Result Error(std::string message) {
    return Result(ResultCode::kError, std::move(message));
  }

  bool ok() const { return code_ == ResultCode::kOk; }
  ResultCode code() const { return code_; }
  int native_status() const { return native_status_; }
  const std::string& message() const { return message_; }

  std::string ToString() const;

  bool operator==(const Result& other) const {
    return code_ == other.code_ && native_status_ == other.native_status_ &&
           message_ == other.message_;
  }
  bool operator!=(const Result& other) const { return !(*this == other); }

 private:
  ResultCode code_;
  int native_status_;
  std::string message_;
};

// Name of a ResultCode as used by Result::ToString ("ReadError", ...).
const char* ResultCodeName(ResultCode code);

#endif  // RESULT_HPP
