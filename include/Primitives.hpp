#pragma once

#include "MeshData.hpp"
#include "Types.hpp"

#include <glm/glm.hpp>

#include <vector>

// 圆角矩形卡片几何体生成
namespace prim {

using Outline = std::vector<glm::vec2>;

// Points of a circular arc from startAngle to endAngle (radians), steps + 1 samples.
// steps < 1 yields the start point only.
std::vector<glm::vec2> arc(const glm::vec2& center, float radius,
                           float startAngle, float endAngle, int steps);

// Closed CCW outline of a width x height rectangle centred on the origin whose
// corners are quarter circles of the given radius. 4 * cornerSteps points for
// radius > 0; radius = 0 gives the four rectangle corners.
Outline roundedRectOutline(float width, float height, float radius, int cornerSteps);

// Removes consecutive points closer than eps, including last -> first.
void removeCoincidentPoints(Outline& outline, float eps = cfg::OUTLINE_MERGE_EPS);

// Shoelace area, positive for counter-clockwise.
float signedArea(const Outline& outline);

// Fills the outline into a cap at +thickness/2 and extrudes it down by
// thickness. Vertices 0..N-1 are the top ring, N..2N-1 the bottom ring.
// Faces: [0] top, [1] bottom, [2..N+1] sides.
SolidMesh extrudeOutline(const Outline& outline, float thickness);

SolidMesh makeRoundedRectSolid(const CardParams& params);

// Face normals (Newell) and angle-weighted vertex normals.
void recomputeNormals(SolidMesh& mesh);

glm::vec3 faceNormal(const SolidMesh& mesh, size_t face);
glm::vec3 faceCentroid(const SolidMesh& mesh, size_t face);

} // namespace prim
