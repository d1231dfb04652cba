// tests/test_main.cpp
#include "test_framework.hpp"
#include <cstring>

// Tests register themselves from the other translation units.
// Usage: mos_tests [substring]  runs only tests whose name contains substring.
int main(int argc, char** argv) {
    const char* filter = argc > 1 ? argv[1] : nullptr;
    std::size_t ran = 0, passed = 0;
    for (const auto& test : tfw::registry()) {
        if (filter && test.name.find(filter) == std::string::npos) continue;
        ++ran;
        std::cout << "[ RUN      ] " << test.name << std::endl;
        auto start = std::chrono::high_resolution_clock::now();
        auto seconds = [&] {
            std::chrono::duration<double> elapsed = std::chrono::high_resolution_clock::now() - start;
            return elapsed.count();
        };
        try {
            test.fn();
            std::cout << "[       OK ] " << test.name << " (" << seconds() << "s)" << std::endl;
            ++passed;
        } catch (const tfw::Failure& e) {
            std::cout << e.what() << std::endl;
            std::cout << "[  FAILED  ] " << test.name << " (" << seconds() << "s)" << std::endl;
        } catch (const std::exception& e) {
            std::cout << "[  EXCEPTION  ] " << test.name << ": " << e.what() << " (" << seconds() << "s)" << std::endl;
        }
    }
    std::cout << "[==========] " << ran << " tests ran. " << passed << " passed, " << (ran - passed) << " failed." << std::endl;
    return (ran > 0 && passed == ran) ? 0 : 1;
}
