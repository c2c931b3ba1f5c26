// tests/test_framework.hpp
#pragma once
#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <exception>
#include <functional>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace tfw {

struct TestCase {
    std::string name;
    std::function<void()> fn;
};

inline std::vector<TestCase>& registry() {
    static std::vector<TestCase> r;
    return r;
}

struct Registrar {
    Registrar(const std::string& name, std::function<void()> fn) {
        registry().push_back({name, std::move(fn)});
    }
};

#define CONCAT_INNER(a,b) a##b
#define CONCAT(a,b) CONCAT_INNER(a,b)

#define TEST(name) \
    static void CONCAT(test_fn_,__LINE__)(); \
    static ::tfw::Registrar CONCAT(test_reg_,__LINE__)(name, CONCAT(test_fn_,__LINE__)); \
    static void CONCAT(test_fn_,__LINE__)()

struct Failure : public std::exception {
    std::string msg;
    explicit Failure(std::string m) : msg(std::move(m)) {}
    const char* what() const noexcept override { return msg.c_str(); }
};

inline std::string loc(const char* file, int line) {
    std::ostringstream oss;
    oss << file << ":" << line;
    return oss.str();
}

inline void assert_true(bool cond, const char* expr, const char* file, int line) {
    if (!cond) {
        std::ostringstream oss;
        oss << "[ASSERT_TRUE FAILED] " << expr << " at " << loc(file, line);
        throw Failure(oss.str());
    }
}
#define ASSERT_TRUE(x) ::tfw::assert_true((x), #x, __FILE__, __LINE__)
#define ASSERT_FALSE(x) ::tfw::assert_true(!(x), "!(" #x ")", __FILE__, __LINE__)

inline void assert_near(double a, double b, double eps, const char* exprA, const char* exprB, const char* file, int line) {
    if (std::isnan(a) || std::isnan(b) || std::isinf(a) || std::isinf(b) || std::fabs(a - b) > eps) {
        std::ostringstream oss;
        oss << "[ASSERT_NEAR FAILED] |" << exprA << " - " << exprB << "| = " << std::fabs(a-b)
            << " > " << eps << " at " << loc(file, line) << "\n  " << exprA << " = " << a << "\n  " << exprB << " = " << b;
        throw Failure(oss.str());
    }
}
#define ASSERT_NEAR(a,b,eps) ::tfw::assert_near((double)(a),(double)(b),(double)(eps), #a, #b, __FILE__, __LINE__)

// ---- value comparisons ----
#define TFW_GEN_CMP(NAME, OPSTR, OP) \
template <class A, class B> \
inline void assert_##NAME(const A& a, const B& b, const char* ea,const char* eb,const char* file,int line){ \
    if (!(a OP b)) { std::ostringstream oss; \
      oss << "[ASSERT_" #NAME " FAILED] " << ea << " " OPSTR " " << eb << " at " << loc(file,line) \
          << "\n  " << ea << " = " << a << "\n  " << eb << " = " << b; \
      throw Failure(oss.str()); } }

TFW_GEN_CMP(eq, "==", ==)
TFW_GEN_CMP(ne, "!=", !=)
TFW_GEN_CMP(lt, "<" , < )
TFW_GEN_CMP(le, "<=", <=)
TFW_GEN_CMP(gt, ">" , > )
TFW_GEN_CMP(ge, ">=", >=)
#undef TFW_GEN_CMP

// element-wise |a[i] - b[i]| <= atol + rtol*|b[i]| over any indexable sequence
template <class A, class B>
inline void assert_allclose(const A& a, const B& b, double atol, double rtol,
                            const char* ea, const char* eb, const char* file, int line) {
    if (a.size() != b.size()) {
        std::ostringstream oss;
        oss << "[ASSERT_ALLCLOSE FAILED] size mismatch: " << ea << ".size()=" << a.size()
            << " vs " << eb << ".size()=" << b.size() << " at " << loc(file, line);
        throw Failure(oss.str());
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        const double ai = static_cast<double>(a[i]), bi = static_cast<double>(b[i]);
        const double diff = std::fabs(ai - bi);
        const double tol = atol + rtol * std::fabs(bi);
        if (!(diff <= tol)) {
            std::ostringstream oss;
            oss << "[ASSERT_ALLCLOSE FAILED] at " << loc(file, line)
                << "\n  first mismatch i=" << i << ": |" << ea << "[" << i << "] - " << eb << "[" << i << "]| = " << diff
                << " > " << tol
                << "\n  " << ea << "[" << i << "] = " << ai
                << "\n  " << eb << "[" << i << "] = " << bi;
            throw Failure(oss.str());
        }
    }
}

// ---- exceptions ----
template <class Fn>
inline void assert_throws(Fn&& fn, const char* expr, const char* file, int line) {
    bool thrown = false;
    try { fn(); } catch (const std::exception&) { thrown = true; }
    if (!thrown) {
        std::ostringstream oss;
        oss << "[ASSERT_THROWS FAILED] expected exception: " << expr << " at " << loc(file, line);
        throw Failure(oss.str());
    }
}

template <class E, class Fn>
inline void assert_throws_as(Fn&& fn, const char* expr, const char* type, const char* file, int line) {
    try {
        fn();
    } catch (const E&) {
        return;
    } catch (const std::exception& e) {
        std::ostringstream oss;
        oss << "[ASSERT_THROWS_AS FAILED] " << expr << " threw something other than " << type
            << ": " << e.what() << " at " << loc(file, line);
        throw Failure(oss.str());
    }
    std::ostringstream oss;
    oss << "[ASSERT_THROWS_AS FAILED] expected " << type << " from " << expr << " at " << loc(file, line);
    throw Failure(oss.str());
}

template <class Fn>
inline void assert_no_throw(Fn&& fn, const char* expr, const char* file, int line) {
    try { fn(); } catch (const std::exception& e) {
        std::ostringstream oss;
        oss << "[ASSERT_NO_THROW FAILED] threw: " << e.what() << " in " << expr << " at " << loc(file, line);
        throw Failure(oss.str());
    }
}

} // namespace tfw

#define ASSERT_EQ(a,b) ::tfw::assert_eq((a),(b), #a, #b, __FILE__, __LINE__)
#define ASSERT_NE(a,b) ::tfw::assert_ne((a),(b), #a, #b, __FILE__, __LINE__)
#define ASSERT_LT(a,b) ::tfw::assert_lt((a),(b), #a, #b, __FILE__, __LINE__)
#define ASSERT_LE(a,b) ::tfw::assert_le((a),(b), #a, #b, __FILE__, __LINE__)
#define ASSERT_GT(a,b) ::tfw::assert_gt((a),(b), #a, #b, __FILE__, __LINE__)
#define ASSERT_GE(a,b) ::tfw::assert_ge((a),(b), #a, #b, __FILE__, __LINE__)

#define ASSERT_ALLCLOSE_VEC(a,b,atol,rtol) ::tfw::assert_allclose((a),(b),(double)(atol),(double)(rtol), #a, #b, __FILE__, __LINE__)

#define ASSERT_THROWS(expr) ::tfw::assert_throws([&](){ (void)(expr); }, #expr, __FILE__, __LINE__)
#define ASSERT_THROWS_AS(expr, E) ::tfw::assert_throws_as<E>([&](){ (void)(expr); }, #expr, #E, __FILE__, __LINE__)
#define ASSERT_NO_THROW(expr) ::tfw::assert_no_throw([&](){ (void)(expr); }, #expr, __FILE__, __LINE__)
