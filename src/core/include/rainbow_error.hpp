#pragma once

#include "rainbow_types.hpp"

#include <optional>
#include <stdexcept>
#include <string>

namespace rainbow {

/**
 * @brief Caller-facing failure categories.
 */
enum class ErrorCode {
    UNSUPPORTED_MIME_TYPE,
    UNKNOWN_TECHNIQUE,
    AMBIGUOUS_OR_UNDECODABLE,
    CORRUPT_PACKET,
    ROLE_MISMATCH,
    INCOMPLETE_SEQUENCE,
    INVALID_ARGUMENT
};

const char* error_code_to_string(ErrorCode code) noexcept;

/**
 * @brief Error surfaced by encode/decode entry points.
 *
 * Deterministic for a given input; the core never retries.
 */
class RainbowError : public std::runtime_error {
public:
    RainbowError(ErrorCode code, const std::string& message)
        : std::runtime_error(compose(code, std::nullopt, message))
        , code_(code) {}

    RainbowError(ErrorCode code, Technique technique, const std::string& message)
        : std::runtime_error(compose(code, technique, message))
        , code_(code)
        , technique_(technique) {}

    ErrorCode code() const noexcept { return code_; }
    std::optional<Technique> technique() const noexcept { return technique_; }

private:
    static std::string compose(ErrorCode code, std::optional<Technique> technique,
                               const std::string& message);

    ErrorCode code_;
    std::optional<Technique> technique_;
};

/**
 * @brief Host-grammar violation raised by the markup/JSON/CSS readers and
 *        by codec decoders.  CarrierCodec::decode() turns it into
 *        RainbowError(CORRUPT_PACKET).
 */
class FormatError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief A codec was asked to embed more than its capacity.
 *
 * Programming error in the caller of the codec (normally the packetizer),
 * never a recoverable condition.
 */
class CapacityExceeded : public std::logic_error {
public:
    CapacityExceeded(Technique technique, size_t requested, size_t capacity);

    Technique technique() const noexcept { return technique_; }
    size_t requested() const noexcept { return requested_; }
    size_t capacity() const noexcept { return capacity_; }

private:
    Technique technique_;
    size_t requested_;
    size_t capacity_;
};

} // namespace rainbow
