#include "embedding.h"

#include <cmath>
#include <cstdio>
#include <string>

namespace enroll {

namespace {

constexpr double kNormSlack = 0.1;
constexpr double kSameEps = 1e-6;

double l2_norm(const std::vector<float>& v) noexcept {
    double s = 0.0;
    for (float x : v)
        s += double(x) * double(x);
    return std::sqrt(s);
}

} // namespace

Status validate_embedding(const std::vector<float>& v, int expected_dim) noexcept {
    if (expected_dim <= 0) return Status::Invalid("validate_embedding: expected_dim must be > 0");

    if (v.size() != static_cast<std::size_t>(expected_dim)) {
        return Status::Invalid("embedding must be " + std::to_string(expected_dim) + " dimensions, got " +
                               std::to_string(v.size()));
    }

    for (std::size_t i = 0; i < v.size(); ++i) {
        if (!std::isfinite(v[i])) return Status::Invalid("invalid embedding value at index " + std::to_string(i));
    }

    const double norm = l2_norm(v);
    if (std::fabs(norm - 1.0) > kNormSlack) {
        char buf[64];
        std::snprintf(buf, sizeof(buf), "%.4f", norm);
        return Status::Invalid(std::string("embedding not normalized, L2 norm: ") + buf);
    }

    const float first = v.front();
    bool all_same = true;
    for (float x : v) {
        if (std::fabs(double(x) - double(first)) >= kSameEps) {
            all_same = false;
            break;
        }
    }
    if (all_same) return Status::Invalid("suspicious embedding pattern (all values equal)");

    return Status::Ok();
}

void l2_normalize(std::vector<float>& v) noexcept {
    const double n = l2_norm(v);
    if (!(n > 0.0) || !std::isfinite(n)) return;
    const float inv = static_cast<float>(1.0 / n);
    for (float& x : v)
        x *= inv;
}

float cosine_similarity(const std::vector<float>& a, const std::vector<float>& b) noexcept {
    if (a.size() != b.size() || a.empty()) return 0.0f;

    double dot = 0.0, na = 0.0, nb = 0.0;
    for (std::size_t i = 0; i < a.size(); ++i) {
        dot += double(a[i]) * double(b[i]);
        na += double(a[i]) * double(a[i]);
        nb += double(b[i]) * double(b[i]);
    }
    if (na == 0.0 || nb == 0.0) return 0.0f;
    return static_cast<float>(dot / (std::sqrt(na) * std::sqrt(nb)));
}

bool verify_face(const std::vector<float>& a, const std::vector<float>& b, float threshold) noexcept {
    return cosine_similarity(a, b) >= threshold;
}

} // namespace enroll
