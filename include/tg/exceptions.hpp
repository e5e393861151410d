#pragma once

#include <exception>
#include <string>

namespace tg {

// Base exception for all Bot API related errors
class TelegramException : public std::exception {
public:
    explicit TelegramException(const std::string& message) : message_(message) {}

    const char* what() const noexcept override { return message_.c_str(); }

    const std::string& message() const { return message_; }

private:
    std::string message_;
};

// Network-related exceptions
class NetworkException : public TelegramException {
public:
    explicit NetworkException(const std::string& message) : TelegramException(message) {}
};

class TimeoutException : public NetworkException {
public:
    explicit TimeoutException(const std::string& operation = "")
        : NetworkException("Operation timed out" + (operation.empty() ? "" : ": " + operation)) {}
};

class CancelledException : public NetworkException {
public:
    explicit CancelledException(const std::string& operation = "")
        : NetworkException("Operation cancelled" + (operation.empty() ? "" : ": " + operation)) {}
};

// The Bot API answered with ok=false (anything other than a rate limit)
class ApiException : public TelegramException {
public:
    ApiException(const std::string& method, int code, const std::string& description)
        : TelegramException("Bot API " + method + " failed [" + std::to_string(code) + "]: " + description),
          method_(method),
          code_(code),
          description_(description) {}

    const std::string& method() const { return method_; }
    int code() const { return code_; }
    const std::string& description() const { return description_; }

private:
    std::string method_;
    int code_;
    std::string description_;
};

class InvalidResponseException : public TelegramException {
public:
    InvalidResponseException(const std::string& method, const std::string& detail)
        : TelegramException("Invalid Bot API response from " + method + ": " + detail) {}
};

// Credential or storage chat failed the self-check
class BotValidationException : public TelegramException {
public:
    explicit BotValidationException(const std::string& message) : TelegramException(message) {}
};

// Local file-related exceptions
class FileException : public TelegramException {
public:
    explicit FileException(const std::string& message) : TelegramException(message) {}
};

class FileNotFoundException : public FileException {
public:
    explicit FileNotFoundException(const std::string& path) : FileException("File not found: " + path) {}
};

class FileDownloadException : public FileException {
public:
    FileDownloadException(const std::string& path, const std::string& reason)
        : FileException("Failed to download file " + path + ": " + reason) {}
};

}  // namespace tg
