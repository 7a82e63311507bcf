#include "Primitives.hpp"

#include <glm/glm.hpp>

#include <algorithm>
#include <cmath>
#include <vector>

namespace prim {

static constexpr double PI = 3.14159265358979323846;
static constexpr double HALF_PI = 0.5 * PI;

static glm::vec2 arcPoint(const glm::vec2& center, float radius, double angle) {
    return glm::vec2(center.x + radius * (float)std::cos(angle),
                     center.y + radius * (float)std::sin(angle));
}

static std::vector<glm::vec2> arcSamples(const glm::vec2& center, float radius,
                                         double startAngle, double endAngle, int steps) {
    std::vector<glm::vec2> pts;
    if (steps < 1) {
        pts.push_back(arcPoint(center, radius, startAngle));
        return pts;
    }

    pts.reserve((size_t)steps + 1);
    for (int i = 0; i <= steps; ++i) {
        double a = startAngle + (endAngle - startAngle) * ((double)i / (double)steps);
        pts.push_back(arcPoint(center, radius, a));
    }
    return pts;
}

std::vector<glm::vec2> arc(const glm::vec2& center, float radius,
                           float startAngle, float endAngle, int steps) {
    return arcSamples(center, radius, startAngle, endAngle, steps);
}

Outline roundedRectOutline(float width, float height, float radius, int cornerSteps) {
    const float hw = 0.5f * width;
    const float hh = 0.5f * height;

    // Arc centres, counter-clockwise from the +x+y corner.
    const glm::vec2 centers[4] = {
        { hw - radius,  hh - radius},
        {-hw + radius,  hh - radius},
        {-hw + radius, -hh + radius},
        { hw - radius, -hh + radius},
    };

    Outline outline;
    outline.reserve((size_t)(4 * std::max(cornerSteps, 1)));

    for (int k = 0; k < 4; ++k) {
        const double a0 = k * HALF_PI;
        const double a1 = (k + 1) * HALF_PI;
        std::vector<glm::vec2> pts = arcSamples(centers[k], radius, a0, a1, cornerSteps);

        // Every arc drops its first sample: the flat edge from the previous
        // corner runs straight to the second one.
        auto first = pts.size() > 1 ? pts.begin() + 1 : pts.begin();
        outline.insert(outline.end(), first, pts.end());
    }

    removeCoincidentPoints(outline);
    return outline;
}

void removeCoincidentPoints(Outline& outline, float eps) {
    if (outline.size() < 2) return;

    Outline out;
    out.reserve(outline.size());
    for (const auto& p : outline) {
        if (out.empty() || glm::distance(out.back(), p) > eps) {
            out.push_back(p);
        }
    }
    while (out.size() > 1 && glm::distance(out.back(), out.front()) <= eps) {
        out.pop_back();
    }
    outline.swap(out);
}

float signedArea(const Outline& outline) {
    const size_t n = outline.size();
    if (n < 3) return 0.0f;

    double twice = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const glm::vec2& a = outline[i];
        const glm::vec2& b = outline[(i + 1) % n];
        twice += (double)a.x * b.y - (double)b.x * a.y;
    }
    return (float)(0.5 * twice);
}

SolidMesh extrudeOutline(const Outline& outline, float thickness) {
    Outline ring = outline;
    if (signedArea(ring) < 0.0f) {
        std::reverse(ring.begin(), ring.end());
    }

    const unsigned int n = (unsigned int)ring.size();
    const float top = 0.5f * thickness;
    const float bottom = top - thickness;

    SolidMesh mesh;
    mesh.positions.reserve((size_t)n * 2);
    mesh.faces.reserve((size_t)n + 2);

    for (const auto& p : ring) mesh.positions.emplace_back(p.x, p.y, top);
    for (const auto& p : ring) mesh.positions.emplace_back(p.x, p.y, bottom);

    std::vector<unsigned int> topFace(n);
    std::vector<unsigned int> bottomFace(n);
    for (unsigned int i = 0; i < n; ++i) {
        topFace[i] = i;
        bottomFace[i] = n + (n - 1 - i); // reversed: faces -z
    }
    mesh.faces.push_back(std::move(topFace));
    mesh.faces.push_back(std::move(bottomFace));

    // Side quad per outline edge i -> j
    for (unsigned int i = 0; i < n; ++i) {
        unsigned int j = (i + 1) % n;
        mesh.faces.push_back({n + i, n + j, j, i});
    }

    recomputeNormals(mesh);
    return mesh;
}

SolidMesh makeRoundedRectSolid(const CardParams& params) {
    Outline outline = roundedRectOutline(params.width, params.height, params.radius, params.cornerSteps);
    return extrudeOutline(outline, params.thickness);
}

glm::vec3 faceNormal(const SolidMesh& mesh, size_t face) {
    const auto& f = mesh.faces[face];
    const size_t k = f.size();

    glm::vec3 n(0.0f);
    for (size_t i = 0; i < k; ++i) {
        const glm::vec3& cur = mesh.positions[f[i]];
        const glm::vec3& next = mesh.positions[f[(i + 1) % k]];
        n.x += (cur.y - next.y) * (cur.z + next.z);
        n.y += (cur.z - next.z) * (cur.x + next.x);
        n.z += (cur.x - next.x) * (cur.y + next.y);
    }

    float len = glm::length(n);
    return len > 0.0f ? n / len : glm::vec3(0.0f);
}

glm::vec3 faceCentroid(const SolidMesh& mesh, size_t face) {
    const auto& f = mesh.faces[face];
    glm::vec3 c(0.0f);
    if (f.empty()) return c;
    for (unsigned int idx : f) c += mesh.positions[idx];
    return c / (float)f.size();
}

void recomputeNormals(SolidMesh& mesh) {
    mesh.faceNormals.resize(mesh.faces.size());
    for (size_t i = 0; i < mesh.faces.size(); ++i) {
        mesh.faceNormals[i] = faceNormal(mesh, i);
    }

    mesh.vertexNormals.assign(mesh.positions.size(), glm::vec3(0.0f));
    for (size_t fi = 0; fi < mesh.faces.size(); ++fi) {
        const auto& f = mesh.faces[fi];
        const size_t k = f.size();
        for (size_t c = 0; c < k; ++c) {
            const glm::vec3& prev = mesh.positions[f[(c + k - 1) % k]];
            const glm::vec3& cur = mesh.positions[f[c]];
            const glm::vec3& next = mesh.positions[f[(c + 1) % k]];

            glm::vec3 e0 = prev - cur;
            glm::vec3 e1 = next - cur;
            float l0 = glm::length(e0);
            float l1 = glm::length(e1);
            if (l0 <= 0.0f || l1 <= 0.0f) continue;

            float cosA = glm::clamp(glm::dot(e0, e1) / (l0 * l1), -1.0f, 1.0f);
            mesh.vertexNormals[f[c]] += mesh.faceNormals[fi] * std::acos(cosA);
        }
    }

    for (auto& n : mesh.vertexNormals) {
        float len = glm::length(n);
        if (len > 0.0f) n /= len;
    }
}

} // namespace prim
