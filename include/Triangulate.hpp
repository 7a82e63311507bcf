#pragma once

#include "MeshData.hpp"

#include <glm/glm.hpp>

#include <array>
#include <vector>

namespace prim {

using Triangle = std::array<unsigned int, 3>;

// Ear clipping of a simple polygon. Indices refer to poly; triangles keep the
// polygon's winding. A fan covers whatever remains if no ear can be found.
std::vector<Triangle> triangulatePolygon(const std::vector<glm::vec2>& poly);

// Triangles for every face of the mesh, indices into mesh.positions.
std::vector<Triangle> triangulateFaces(const SolidMesh& mesh);

// Triangles of a single face, indices into mesh.positions.
std::vector<Triangle> triangulateFace(const SolidMesh& mesh, size_t face);

} // namespace prim
