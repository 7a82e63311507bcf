#include "CardScene.hpp"

#include "Material.hpp"
#include "Primitives.hpp"
#include "Util.hpp"

#include <string>

namespace card {

CardSceneResult buildCardScene(Host& host, const CardSceneOptions& options) {
    if (options.clearScene) {
        host.clearScene();
    }

    const CardParams& p = options.params;
    prim::Outline outline = prim::roundedRectOutline(p.width, p.height, p.radius, p.cornerSteps);
    SolidMesh solid = prim::extrudeOutline(outline, p.thickness);

    CardSceneResult result;
    result.outlinePoints = outline.size();
    result.vertices = solid.vertexCount();
    result.faces = solid.faceCount();
    result.object = host.addSolid(cfg::CARD_OBJECT_NAME, cfg::CARD_MESH_NAME, solid);
    host.setShadeSmooth(result.object, options.shadeSmooth);

    MaterialInputs& mat = host.addMaterial(options.material.name);
    result.materialParamsApplied = applyMaterial(mat, options.material);
    host.assignMaterial(result.object, mat.name());

    host.addCamera(options.camera);
    host.addLight(options.light);

    util::logInfo("Black card created: outline=" + std::to_string(result.outlinePoints) +
                  " vertices=" + std::to_string(result.vertices) +
                  " faces=" + std::to_string(result.faces) +
                  " light=" + lightTypeName(options.light.type));
    return result;
}

} // namespace card
