#pragma once

#include <glm/glm.hpp>

#include <vector>

// CPU-side polygon mesh. Faces list vertex indices counter-clockwise as seen
// from outside the solid.
struct SolidMesh {
    std::vector<glm::vec3> positions;
    std::vector<std::vector<unsigned int>> faces;

    // Filled by prim::recomputeNormals
    std::vector<glm::vec3> faceNormals;
    std::vector<glm::vec3> vertexNormals;

    bool smooth = false;

    size_t vertexCount() const { return positions.size(); }
    size_t faceCount() const { return faces.size(); }
};
