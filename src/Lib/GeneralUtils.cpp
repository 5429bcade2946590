#include "GeneralUtils.h"
#include "../Settings.h"
#include <array>
#include <boost/asio.hpp>
#include <boost/system/error_code.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <chrono>
#include <cstdint>
#include <exception>
#include <folly/experimental/exception_tracer/ExceptionTracer.h>
#include <folly/experimental/exception_tracer/StackTrace.h>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

void dumpExceptions(std::exception& exception) {
    std::cerr << "--- Exception: " << exception.what() << '\n';
    auto exceptions = folly::exception_tracer::getCurrentExceptions();
    for (auto& exc : exceptions) {
        std::cerr << exc << "\n";
    }
}

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
auto acceptingConnections(uint16_t port) -> bool {
    using boost::asio::io_context, boost::asio::ip::tcp;
    using ec = boost::system::error_code;

    bool result = false;

    for (auto counter = 0; counter < 10 && !result; counter++) {
        try {
            io_context svc;
            tcp::socket socket(svc);
            boost::asio::steady_timer tim(svc, std::chrono::milliseconds(100));

            tim.async_wait([&](ec) { socket.cancel(); });
            socket.async_connect({{}, port}, [&](ec errorCode) {
                result = !errorCode;
            });

            svc.run();
        } catch (boost::system::system_error& error) {
            // The port isn't ready yet, try again
            result = false;
        }

        if (!result) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }

    return result;
}
// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

auto isValidTransferId(const std::string& transferId) -> bool {
    if (transferId.empty() || transferId.length() > MAX_TRANSFER_ID_LENGTH) {
        return false;
    }

    // The transfer id is used both as a url path segment and as a broker key
    const std::string validChars = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ1234567890-_";
    return transferId.find_first_not_of(validChars) == std::string::npos;
}

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
auto formatSize(uint64_t bytes) -> std::string {
    if (bytes == 0) {
        return "0 B";
    }

    const std::array<const char*, 5> units = {"B", "KiB", "MiB", "GiB", "TiB"};

    auto value = static_cast<double>(bytes);
    size_t unit = 0;
    while (value >= 1024.0 && unit < units.size() - 1) {
        value /= 1024.0;
        unit++;
    }

    std::ostringstream stream;
    stream << std::fixed << std::setprecision(1) << value << " " << units.at(unit);
    return stream.str();
}
// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

auto generateUUID() -> std::string {
    auto uuid = boost::uuids::random_generator()();
    return boost::uuids::to_string(uuid);
}

// To prevent the compiler optimizing away the exception tracing from folly, we need to reference it.
extern "C" auto getCaughtExceptionStackTraceStack() -> const folly::exception_tracer::StackTrace*;
extern "C" auto getUncaughtExceptionStackTraceStack() -> const folly::exception_tracer::StackTraceStack*;

// forceExceptionStackTraceRef is intentionally unused and marked volatile so the compiler doesn't optimize away the
// required functions from folly.
volatile void forceExceptionStackTraceRef()
{
    getCaughtExceptionStackTraceStack();
    getUncaughtExceptionStackTraceStack();
}
