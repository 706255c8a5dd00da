/**
 * @file errors.hpp
 * @brief Exception types thrown inside libshrink.
 *
 * Codec errors never leave FileProcessor: they are turned into Failure
 * values on the FileRecord. ConfigurationError is fatal for the whole run
 * and is expected to reach main().
 */

#ifndef SHRINK_ERRORS_HPP
#define SHRINK_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace shrink {

/**
 * @brief Invalid or unusable configuration: bad quality, unusable folder,
 * unreadable config file, broken language pack.
 */
class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief A language pack does not define a message the caller needs.
 */
class MissingMessageError : public ConfigurationError {
public:
    MissingMessageError(const std::string& lang_code, std::string key)
        : ConfigurationError("language pack '" + lang_code + "' has no message '" + key + "'"),
          key_(std::move(key)) {}

    [[nodiscard]] const std::string& key() const noexcept { return key_; }

private:
    std::string key_;
};

/// Base class for errors raised by an ICodec.
class CodecError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// The input could not be opened or decoded as an image.
class DecodeError : public CodecError {
public:
    using CodecError::CodecError;
};

/// The image was decoded but re-encoding or writing the output failed.
class EncodeError : public CodecError {
public:
    using CodecError::CodecError;
};

} // namespace shrink

#endif // SHRINK_ERRORS_HPP
