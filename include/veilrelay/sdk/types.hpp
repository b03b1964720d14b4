/**
 * @file types.hpp
 * @brief Common type definitions for the relay SDK
 */

#pragma once

#include "veilrelay/sdk/errors.hpp"
#include "veilrelay/sdk/constants.hpp"
#include <vector>
#include <array>
#include <string>
#include <optional>
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <utility>
#include <sodium.h>

namespace veilrelay {
namespace sdk {

/**
 * @brief Result type for operations that can fail
 *
 * Carries an error code and, optionally, a detail message. The detail is what
 * gets surfaced to callers, so it must never contain key material.
 */
template<typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)), error_(ErrorCode::SUCCESS) {}
    Result(ErrorCode error) : error_(error) {}
    Result(ErrorCode error, std::string message) : error_(error), message_(std::move(message)) {}

    bool is_ok() const { return error_ == ErrorCode::SUCCESS; }
    bool is_err() const { return !is_ok(); }

    const T& value() const {
        if (is_err()) {
            throw std::runtime_error("Attempted to access value of an error result");
        }
        return value_;
    }

    T& value() {
        if (is_err()) {
            throw std::runtime_error("Attempted to access value of an error result");
        }
        return value_;
    }

    ErrorCode error() const { return error_; }

    std::string error_message() const {
        return message_.empty() ? ErrorCodeToString(error_) : message_;
    }

private:
    T value_{};
    ErrorCode error_;
    std::string message_;
};

// Specialization for void result
template<>
class Result<void> {
public:
    Result() : error_(ErrorCode::SUCCESS) {}
    Result(ErrorCode error) : error_(error) {}
    Result(ErrorCode error, std::string message) : error_(error), message_(std::move(message)) {}

    bool is_ok() const { return error_ == ErrorCode::SUCCESS; }
    bool is_err() const { return !is_ok(); }

    ErrorCode error() const { return error_; }

    std::string error_message() const {
        return message_.empty() ? ErrorCodeToString(error_) : message_;
    }

private:
    ErrorCode error_;
    std::string message_;
};

// Common type aliases
using ByteVector = std::vector<uint8_t>;
using Hash32 = std::array<uint8_t, constants::HASH_SIZE>;
using TimePoint = std::chrono::system_clock::time_point;

/**
 * @brief Secure container for sensitive data with automatic zeroing
 */
template<typename T>
class SecureContainer {
public:
    SecureContainer() : data_(nullptr), size_(0) {}

    explicit SecureContainer(size_t size) : size_(size) {
        data_ = static_cast<T*>(sodium_malloc(sizeof(T) * size));
        if (!data_) {
            throw std::bad_alloc();
        }
        sodium_mlock(data_, sizeof(T) * size);
    }

    ~SecureContainer() {
        release();
    }

    SecureContainer(const SecureContainer&) = delete;
    SecureContainer& operator=(const SecureContainer&) = delete;

    SecureContainer(SecureContainer&& other) noexcept : data_(other.data_), size_(other.size_) {
        other.data_ = nullptr;
        other.size_ = 0;
    }

    SecureContainer& operator=(SecureContainer&& other) noexcept {
        if (this != &other) {
            release();
            data_ = other.data_;
            size_ = other.size_;
            other.data_ = nullptr;
            other.size_ = 0;
        }
        return *this;
    }

    T* data() { return data_; }
    const T* data() const { return data_; }
    size_t size() const { return size_; }

private:
    void release() {
        if (data_) {
            sodium_memzero(data_, sizeof(T) * size_);
            sodium_munlock(data_, sizeof(T) * size_);
            sodium_free(data_);
            data_ = nullptr;
        }
    }

    T* data_;
    size_t size_;
};

using SecureBytes = SecureContainer<uint8_t>;

} // namespace sdk
} // namespace veilrelay
