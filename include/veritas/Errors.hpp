/**
 * @file Errors.hpp
 * @brief Centralized error handling utilities.
 *
 * Provides the exception hierarchy of the veritas library and a macro
 * for runtime error checking.
 */
#ifndef VERITAS_ERRORS_HPP
#define VERITAS_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace veritas
{

/**
 * @brief Validation error class for veritas library.
 * Used to signal invalid inputs or arguments.
 */
class validation_error : public std::invalid_argument
{
public:
    explicit validation_error(const std::string& message)
        : std::invalid_argument("Validation Error: " + message) {}
};

/**
 * @brief Dimension error class for veritas library.
 * Used to signal a vector whose length does not match the width
 * expected by a neuron, a layer, a cost function or the label encoding.
 */
class dimension_error : public std::invalid_argument
{
public:
    explicit dimension_error(const std::string& message)
        : std::invalid_argument("Dimension Error: " + message) {}
};

/**
 * @brief nan error class for veritas library.
 */
class nan_error : public std::invalid_argument
{
public:
    explicit nan_error(const std::string& message)
        : std::invalid_argument("NaN Error: " + message) {}
};

/**
 * @brief Device-side error class for SYCL kernels in the veritas library.
 * Used to signal issues specific to SYCL device execution.
 */
class device_error : public std::runtime_error
{
public:
    explicit device_error(const std::string& message)
        : std::runtime_error("Device Error: " + message) {}
};

/**
 * @brief I/O error class for veritas library.
 * Used when a network or configuration file cannot be read or written.
 */
class io_error : public std::runtime_error
{
public:
    explicit io_error(const std::string& message)
        : std::runtime_error("IO Error: " + message) {}
};

/**
 * @brief Format error class for veritas library.
 * Used when persisted content is malformed or inconsistent.
 */
class format_error : public std::runtime_error
{
public:
    explicit format_error(const std::string& message)
        : std::runtime_error("Format Error: " + message) {}
};

} // namespace veritas

/**
 * @brief Error checking macro.
 *
 * Evaluates a condition and throws the specified exception type
 * with the given message if the condition is true.
 *
 * @param condition The condition to check (throws if true)
 * @param exception_type The exception type to throw
 * @param message The error message
 *
 * Usage:
 *   VERITAS_CHECK(size == 0, validation_error, "Size must be positive");
 */
#define VERITAS_CHECK(condition, exception_type, message) \
   do \
   { \
      if (condition) \
      { \
         throw exception_type(message); \
      } \
   } while(0)

/**
 * @brief Device-side error checking macro.
 *
 * Evaluates a condition inside a SYCL kernel and, if true:
 *   - atomically sets an error flag to the specified error code
 *   - immediately returns from the current work-item
 *
 * @param condition The condition to evaluate
 * @param p_err Pointer to an int32_t error flag in global/shared memory
 * @param code Error code to atomically set when condition is true
 */
#define VERITAS_DEVICE_CHECK(condition, p_err, code) \
    do \
    { \
        if (condition) \
        { \
            auto atomic_err = sycl::atomic_ref<int32_t, \
                sycl::memory_order::relaxed, \
                sycl::memory_scope::device, \
                sycl::access::address_space::global_space>(*p_err); \
            int32_t expected = 0; \
            atomic_err.compare_exchange_strong(expected, code); \
            return; /* exit current kernel work-item */ \
        } \
    } while (0)

#endif // VERITAS_ERRORS_HPP
