#ifndef TIER_LOG_EXCEPTION_INFO_HPP
#define TIER_LOG_EXCEPTION_INFO_HPP

#include <string>
#include <exception>
#include <typeinfo>
#include <cstdlib>

#if defined(__GNUC__) || defined(__clang__)
#include <cxxabi.h>
#endif

namespace tierlog {
namespace detail {

    /// Readable dynamic type of an exception, e.g. "std::runtime_error".
    inline std::string exceptionTypeName(const std::exception& ex) {
        const char* raw = typeid(ex).name();
#if defined(__GNUC__) || defined(__clang__)
        int status = 0;
        char* demangled = abi::__cxa_demangle(raw, nullptr, nullptr, &status);
        std::string result = (status == 0 && demangled) ? demangled : raw;
        std::free(demangled);
        return result;
#else
        return raw;
#endif
    }

    inline std::string exceptionWhat(const std::exception& ex) {
        const char* what = ex.what();
        return what ? what : "(no message)";
    }

    // Deepest std::nested_exception level followed.
    static constexpr int kMaxCauseDepth = 20;

    struct ExceptionInfo {
        std::string type;
        std::string message;
        std::string chain;  // "Caused by: ..." lines, newline separated
    };

    inline void appendCauses(const std::exception& ex, std::string& chain, int depth) {
        if (depth >= kMaxCauseDepth) return;

        std::string line;
        try {
            std::rethrow_if_nested(ex);
            return;
        } catch (const std::exception& cause) {
            line = "Caused by: " + exceptionTypeName(cause) + ": " + exceptionWhat(cause);
            if (!chain.empty()) chain += '\n';
            chain += line;
            appendCauses(cause, chain, depth + 1);
        } catch (...) {
            if (!chain.empty()) chain += '\n';
            chain += "Caused by: unknown exception";
        }
    }

    inline ExceptionInfo extractExceptionInfo(const std::exception& ex) {
        ExceptionInfo info;
        info.type = exceptionTypeName(ex);
        info.message = exceptionWhat(ex);
        appendCauses(ex, info.chain, 0);
        return info;
    }

    /// "<message> - Exception: <type>: <what>", followed by one
    /// "Caused by:" line per nested exception.
    inline std::string formatExceptionMessage(const std::string& message, const std::exception& ex) {
        ExceptionInfo info = extractExceptionInfo(ex);
        std::string result = message + " - Exception: " + info.type + ": " + info.message;
        if (!info.chain.empty()) {
            result += '\n';
            result += info.chain;
        }
        return result;
    }

} // namespace detail
} // namespace tierlog

#endif // TIER_LOG_EXCEPTION_INFO_HPP
