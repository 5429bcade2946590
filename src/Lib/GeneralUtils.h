//
// General helpers shared by the servers, the broker backends and the tests
//

#ifndef TRANSIT_RELAY_GENERALUTILS_H
#define TRANSIT_RELAY_GENERALUTILS_H

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>

void dumpExceptions(std::exception& exception);
auto acceptingConnections(uint16_t port) -> bool;
auto isValidTransferId(const std::string& transferId) -> bool;
auto formatSize(uint64_t bytes) -> std::string;
auto generateUUID() -> std::string;

struct InterruptableTimer {
    // Returns false if killed
    template<class R, class P>
    auto wait_for( std::chrono::duration<R,P> const& time ) const -> bool {
        std::unique_lock<std::mutex> lock(m);
        return !cv.wait_for(lock, time, [&]{ return terminate; });
    }

    void stop() {
        std::unique_lock<std::mutex> const lock(m);
        terminate = true;
        cv.notify_all();
    }

private:
    mutable std::condition_variable cv;
    mutable std::mutex m;
    bool terminate = false;
};

#ifdef BUILD_TESTS
// NOLINTBEGIN
#define EXPOSE_PROPERTY_FOR_TESTING(term) public: auto get##term () { return &term; } auto set##term (typeof(term) value) { term = value; }
#define EXPOSE_PROPERTY_FOR_TESTING_READONLY(term) public: auto get##term () { return &term; }
#define EXPOSE_FUNCTION_FOR_TESTING(term) public: auto call##term () { return term(); }
#define EXPOSE_FUNCTION_FOR_TESTING_ONE_PARAM(term, param) public: auto call##term (param value) { return term(value); }
// NOLINTEND
#else
// Noop
#define EXPOSE_PROPERTY_FOR_TESTING(x)
#define EXPOSE_PROPERTY_FOR_TESTING_READONLY(x)
#define EXPOSE_FUNCTION_FOR_TESTING(x)
#define EXPOSE_FUNCTION_FOR_TESTING_ONE_PARAM(x, y)
#endif

#endif //TRANSIT_RELAY_GENERALUTILS_H
