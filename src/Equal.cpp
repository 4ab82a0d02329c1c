/**
 * @file Equal.cpp
 * @brief Implementation of structural equality
 */

#include "jpatch/Equal.hpp"
#include <cmath>

namespace jpatch {

namespace {
    bool is_nan(const Value& val) {
        return val.is_number_float() && std::isnan(val.get<double>());
    }
}

bool is_equal(const Value& a, const Value& b) {
    if (a.is_number() && b.is_number()) {
        if (is_nan(a) || is_nan(b)) {
            return is_nan(a) && is_nan(b);
        }
        // nlohmann compares integer, unsigned and float numerically
        return a == b;
    }

    if (a.type() != b.type()) {
        return false;
    }

    if (a.is_array()) {
        if (a.size() != b.size()) {
            return false;
        }
        for (std::size_t i = 0; i < a.size(); ++i) {
            if (!is_equal(a[i], b[i])) {
                return false;
            }
        }
        return true;
    }

    if (a.is_object()) {
        if (a.size() != b.size()) {
            return false;
        }
        for (auto it = a.begin(); it != a.end(); ++it) {
            auto other = b.find(it.key());
            if (other == b.end() || !is_equal(it.value(), *other)) {
                return false;
            }
        }
        return true;
    }

    // null, boolean, string
    return a == b;
}

} // namespace jpatch
