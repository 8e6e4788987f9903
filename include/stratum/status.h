#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace stratum
{

    enum class ErrorCode : uint8_t
    {
        kOk = 0,
        kInvalidArgument = 1,
        kNotFound = 2,
        kAlreadyExists = 3,
        kIO = 4,
        kCorruption = 5,
        kNotSupported = 6,
        kInternal = 7,

        // Migration taxonomy.
        kPreconditionFailure = 16,
        kCheckpointFailure = 17,
        kActionFailure = 18,
        kPostconditionFailure = 19,
        kRollbackFailure = 20,
    };

    const char *ErrorCodeName(ErrorCode code) noexcept;

    /**
     * Status: result of an operation. Owns its message, so it may be built from
     * temporaries and outlive the call that produced it.
     */
    class [[nodiscard]] Status
    {
    public:
        Status() noexcept = default;
        Status(ErrorCode code, std::string msg) : code_(code), msg_(std::move(msg)) {}

        bool ok() const noexcept { return code_ == ErrorCode::kOk; }
        ErrorCode code() const noexcept { return code_; }
        const std::string &message() const noexcept { return msg_; }

        // --- Canonical Factories ---
        static Status Ok() noexcept { return Status(); }
        static Status InvalidArgument(std::string m) { return Status(ErrorCode::kInvalidArgument, std::move(m)); }
        static Status NotFound(std::string m = "not found") { return Status(ErrorCode::kNotFound, std::move(m)); }
        static Status AlreadyExists(std::string m = "already exists") { return Status(ErrorCode::kAlreadyExists, std::move(m)); }
        static Status IOError(std::string m) { return Status(ErrorCode::kIO, std::move(m)); }
        static Status Corruption(std::string m) { return Status(ErrorCode::kCorruption, std::move(m)); }
        static Status NotSupported(std::string m) { return Status(ErrorCode::kNotSupported, std::move(m)); }
        static Status Internal(std::string m) { return Status(ErrorCode::kInternal, std::move(m)); }

        static Status PreconditionFailure(std::string m) { return Status(ErrorCode::kPreconditionFailure, std::move(m)); }
        static Status CheckpointFailure(std::string m) { return Status(ErrorCode::kCheckpointFailure, std::move(m)); }
        static Status ActionFailure(std::string m) { return Status(ErrorCode::kActionFailure, std::move(m)); }
        static Status PostconditionFailure(std::string m) { return Status(ErrorCode::kPostconditionFailure, std::move(m)); }
        static Status RollbackFailure(std::string m) { return Status(ErrorCode::kRollbackFailure, std::move(m)); }

        std::string ToString() const
        {
            if (ok())
                return "OK";
            std::string s = ErrorCodeName(code_);
            if (!msg_.empty())
            {
                s += ": ";
                s += msg_;
            }
            return s;
        }

    private:
        ErrorCode code_{ErrorCode::kOk};
        std::string msg_;
    };

    template <typename T>
    class Result
    {
    public:
        Result(Status s) : status_(std::move(s)) {}
        Result(T value) : status_(Status::Ok()), value_(std::move(value)) {}

        bool ok() const { return status_.ok(); }
        const Status &status() const { return status_; }

        T &value() { return *value_; }
        const T &value() const { return *value_; }
        T &&move_value() { return std::move(*value_); }

    private:
        Status status_{};
        std::optional<T> value_{};
    };

} // namespace stratum
