/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the FourCC library
 * @author Igor
 * @date 14/08/2025
 *
 * This file defines the exception hierarchy and convenience macros for
 * error handling throughout libfcc.
 */

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <sstream>

namespace fcc {

    /**
     * @class fcc_error
     * @brief Base exception class for all libfcc errors
     *
     * All libfcc exceptions derive from this class, making it easy
     * to catch all FourCC-specific errors with a single catch block.
     */
    class fcc_error : public std::runtime_error {
    public:
        explicit fcc_error(const std::string& msg)
            : std::runtime_error(msg) {}
    };

    /**
     * @class short_input_error
     * @brief Thrown when a string or byte source holds fewer than 4 bytes
     *
     * A fourcc is never padded or truncated to fit, so a short source
     * cannot produce a value.
     */
    class short_input_error : public fcc_error {
    public:
        short_input_error(const std::string& msg, std::size_t size)
            : fcc_error(msg), size_(size) {}

        /// Number of bytes the rejected source actually held
        [[nodiscard]] std::size_t size() const noexcept { return size_; }

    private:
        std::size_t size_;
    };

    /**
     * @brief Build error message from variadic arguments
     * @tparam Args Variadic template arguments
     * @param args Arguments to concatenate into error message
     * @return Concatenated error message string
     */
    template<typename... Args>
    std::string build_error_msg(Args&&... args) {
        std::ostringstream oss;
        ((oss << args), ...);
        return oss.str();
    }

    /**
     * @defgroup ExceptionMacros Exception Throwing Macros
     * @{
     */

    /**
     * @def THROW_SHORT_INPUT
     * @brief Throw a short_input_error for a source of the given size
     * @param size Size of the rejected source in bytes
     * @param ... Variable arguments to format into error message
     */
    #define THROW_SHORT_INPUT(size, ...) \
        throw ::fcc::short_input_error(::fcc::build_error_msg(__VA_ARGS__), (size))

    /**
     * @def THROW_SHORT_INPUT_IF
     * @brief Throw a short_input_error when a source is shorter than required
     * @param size Size of the source in bytes
     * @param required Minimum number of bytes needed
     * @param what Description of the source, used in the message
     */
    #define THROW_SHORT_INPUT_IF(size, required, what) \
        do { \
            if ((size) < (required)) \
                THROW_SHORT_INPUT((size), "fourcc needs ", (required), " bytes, ", \
                                  (what), " has ", (size)); \
        } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace fcc
