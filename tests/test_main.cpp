// tests/test_main.cpp
#include "test_framework.hpp"

#include <cstring>

// Tests register themselves from the other translation units; this TU only
// provides main(). An optional argument runs the tests whose name contains it.
int main(int argc, char** argv) {
    const char* filter = argc > 1 ? argv[1] : nullptr;
    const auto& tests = tfw::registry();
    std::size_t ran = 0, passed = 0;
    for (const auto& test : tests) {
        if (filter && test.name.find(filter) == std::string::npos) continue;
        ++ran;
        std::cout << "[ RUN      ] " << test.name << std::endl;
        auto start = std::chrono::high_resolution_clock::now();
        auto elapsed = [&] {
            std::chrono::duration<double> d = std::chrono::high_resolution_clock::now() - start;
            return d.count();
        };
        try {
            test.fn();
            std::cout << "[       OK ] " << test.name << " (" << elapsed() << "s)" << std::endl;
            ++passed;
        } catch (const tfw::Failure& e) {
            std::cout << e.what() << std::endl;
            std::cout << "[  FAILED  ] " << test.name << " (" << elapsed() << "s)" << std::endl;
        } catch (const std::exception& e) {
            std::cout << "[  EXCEPTION  ] " << test.name << ": " << e.what() << " (" << elapsed() << "s)" << std::endl;
        }
    }
    std::cout << "[==========] " << ran << " tests ran. " << passed << " passed, " << (ran - passed) << " failed." << std::endl;
    return passed == ran ? 0 : 1;
}
