#include "Triangulate.hpp"

#include "Primitives.hpp"

#include <cmath>

namespace prim {

static constexpr float EAR_EPS = 1e-12f;

static float cross2(const glm::vec2& a, const glm::vec2& b) {
    return a.x * b.y - a.y * b.x;
}

static bool pointInTriangle(const glm::vec2& p, const glm::vec2& a, const glm::vec2& b, const glm::vec2& c) {
    float d1 = cross2(b - a, p - a);
    float d2 = cross2(c - b, p - b);
    float d3 = cross2(a - c, p - c);

    bool hasNeg = (d1 < 0.0f) || (d2 < 0.0f) || (d3 < 0.0f);
    bool hasPos = (d1 > 0.0f) || (d2 > 0.0f) || (d3 > 0.0f);
    return !(hasNeg && hasPos);
}

std::vector<Triangle> triangulatePolygon(const std::vector<glm::vec2>& poly) {
    std::vector<Triangle> tris;
    const size_t n = poly.size();
    if (n < 3) return tris;

    tris.reserve(n - 2);

    std::vector<unsigned int> work(n);
    for (size_t i = 0; i < n; ++i) work[i] = (unsigned int)i;

    const bool ccw = signedArea(poly) >= 0.0f;

    while (work.size() > 3) {
        bool earFound = false;

        for (size_t i = 0; i < work.size(); ++i) {
            const size_t m = work.size();
            unsigned int ia = work[(i + m - 1) % m];
            unsigned int ib = work[i];
            unsigned int ic = work[(i + 1) % m];
            const glm::vec2& a = poly[ia];
            const glm::vec2& b = poly[ib];
            const glm::vec2& c = poly[ic];

            // Reflex or degenerate corner
            float z = cross2(b - a, c - b);
            if (ccw ? (z <= EAR_EPS) : (z >= -EAR_EPS)) continue;

            bool contains = false;
            for (unsigned int idx : work) {
                if (idx == ia || idx == ib || idx == ic) continue;
                if (pointInTriangle(poly[idx], a, b, c)) {
                    contains = true;
                    break;
                }
            }
            if (contains) continue;

            tris.push_back({ia, ib, ic});
            work.erase(work.begin() + (std::ptrdiff_t)i);
            earFound = true;
            break;
        }

        if (!earFound) {
            for (size_t i = 1; i + 1 < work.size(); ++i) {
                tris.push_back({work[0], work[i], work[i + 1]});
            }
            return tris;
        }
    }

    tris.push_back({work[0], work[1], work[2]});
    return tris;
}

std::vector<Triangle> triangulateFace(const SolidMesh& mesh, size_t face) {
    const auto& f = mesh.faces[face];
    std::vector<Triangle> out;
    if (f.size() < 3) return out;

    if (f.size() == 3) {
        out.push_back({f[0], f[1], f[2]});
        return out;
    }

    // Project onto the plane orthogonal to the dominant normal axis, keeping
    // the orientation so the 2D winding matches the 3D one.
    glm::vec3 n = faceNormal(mesh, face);
    glm::vec3 an = glm::abs(n);
    int axis = 2;
    if (an.x >= an.y && an.x >= an.z) axis = 0;
    else if (an.y >= an.z) axis = 1;

    std::vector<glm::vec2> flat;
    flat.reserve(f.size());
    for (unsigned int idx : f) {
        const glm::vec3& p = mesh.positions[idx];
        glm::vec2 q;
        if (axis == 0) q = glm::vec2(p.y, p.z);
        else if (axis == 1) q = glm::vec2(p.z, p.x);
        else q = glm::vec2(p.x, p.y);
        if (n[axis] < 0.0f) q.x = -q.x;
        flat.push_back(q);
    }

    for (const Triangle& t : triangulatePolygon(flat)) {
        out.push_back({f[t[0]], f[t[1]], f[t[2]]});
    }
    return out;
}

std::vector<Triangle> triangulateFaces(const SolidMesh& mesh) {
    std::vector<Triangle> out;
    for (size_t i = 0; i < mesh.faces.size(); ++i) {
        std::vector<Triangle> tris = triangulateFace(mesh, i);
        out.insert(out.end(), tris.begin(), tris.end());
    }
    return out;
}

} // namespace prim
