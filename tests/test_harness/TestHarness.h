#ifndef AGENTCAD_TEST_HARNESS_H
#define AGENTCAD_TEST_HARNESS_H

#include "core/model/ModelTypes.h"

#include <QString>

#include <algorithm>
#include <cmath>
#include <functional>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace agentcad::test {

struct TestCase {
    std::string name;
    std::function<void()> func;
};

struct RunState {
    std::vector<TestCase> cases;
    std::string current;
    int failures = 0;
    int caseFailures = 0;
};

inline RunState& state() {
    static RunState s;
    return s;
}

namespace detail {

template <typename T>
std::string describe(const T& value) {
    if constexpr (std::is_same_v<T, QString>) {
        return "\"" + value.toStdString() + "\"";
    } else if constexpr (std::is_same_v<T, core::model::ErrorKind>) {
        return core::model::errorKindToString(value);
    } else if constexpr (requires(std::ostream& os, const T& v) { os << v; }) {
        std::ostringstream oss;
        oss << value;
        return oss.str();
    } else {
        return "<unprintable>";
    }
}

template <typename A, typename B>
std::string pair(const A& lhs, const B& rhs) {
    return "lhs=" + describe(lhs) + " rhs=" + describe(rhs);
}

} // namespace detail

/// Records the outcome of one expectation; details are built only on failure
inline void check(bool ok, std::string_view expr, const char* file, int line,
                  const std::function<std::string()>& details = {}) {
    if (ok) {
        return;
    }
    RunState& s = state();
    std::cerr << "  [FAIL] " << s.current << " " << file << ":" << line << " " << expr;
    if (details) {
        std::cerr << " | " << details();
    }
    std::cerr << std::endl;
    ++s.failures;
    ++s.caseFailures;
}

struct Registrar {
    Registrar(std::string name, std::function<void()> func) {
        state().cases.push_back({std::move(name), std::move(func)});
    }
};

#define TEST_CASE(name) \
    static void name(); \
    static ::agentcad::test::Registrar registrar_##name(#name, name); \
    static void name()

#define EXPECT_TRUE(expr) ::agentcad::test::check(static_cast<bool>(expr), #expr, __FILE__, __LINE__)

#define EXPECT_FALSE(expr) ::agentcad::test::check(!(expr), "!(" #expr ")", __FILE__, __LINE__)

#define EXPECT_EQ(a, b) do { \
    const auto _va = (a); \
    const auto _vb = (b); \
    ::agentcad::test::check(_va == _vb, #a " == " #b, __FILE__, __LINE__, \
                            [&] { return ::agentcad::test::detail::pair(_va, _vb); }); \
} while (0)

#define EXPECT_NE(a, b) do { \
    const auto _va = (a); \
    const auto _vb = (b); \
    ::agentcad::test::check(!(_va == _vb), #a " != " #b, __FILE__, __LINE__, \
                            [&] { return ::agentcad::test::detail::pair(_va, _vb); }); \
} while (0)

/// Passes on absolute or relative closeness within @p tol
#define EXPECT_NEAR(a, b, tol) do { \
    const double _va = static_cast<double>(a); \
    const double _vb = static_cast<double>(b); \
    const double _tol = static_cast<double>(tol); \
    const double _diff = std::fabs(_va - _vb); \
    const double _scale = std::max(std::fabs(_va), std::fabs(_vb)); \
    ::agentcad::test::check(_diff <= _tol || _diff <= _tol * _scale, #a " ~= " #b, __FILE__, __LINE__, \
                            [&] { return ::agentcad::test::detail::pair(_va, _vb) + " tol=" + std::to_string(_tol); }); \
} while (0)

#define EXPECT_ERROR(result, kind) do { \
    const auto& _r = (result); \
    ::agentcad::test::check(!_r.success && _r.error == (kind), #result " fails with " #kind, __FILE__, __LINE__, \
                            [&] { \
                                return "success=" + std::to_string(_r.success) + " error=" \
                                       + ::agentcad::core::model::errorKindToString(_r.error) \
                                       + " message=" + std::string(_r.errorMessage); \
                            }); \
} while (0)

#define EXPECT_OK(result) do { \
    const auto& _r = (result); \
    ::agentcad::test::check(_r.success, #result " succeeds", __FILE__, __LINE__, \
                            [&] { return std::string(_r.errorMessage); }); \
} while (0)

inline int runAllTests() {
    RunState& s = state();
    int clean = 0;
    for (const TestCase& tc : s.cases) {
        s.current = tc.name;
        s.caseFailures = 0;
        try {
            tc.func();
        } catch (const std::exception& ex) {
            check(false, "threw", tc.name.c_str(), 0, [&] { return std::string(ex.what()); });
        }
        std::cout << (s.caseFailures == 0 ? "[ OK ] " : "[FAIL] ") << tc.name << std::endl;
        if (s.caseFailures == 0) {
            ++clean;
        }
    }

    std::cout << clean << "/" << s.cases.size() << " cases passed, " << s.failures << " failed expectations"
              << std::endl;
    return s.failures == 0 ? 0 : 1;
}

} // namespace agentcad::test

#endif // AGENTCAD_TEST_HARNESS_H
