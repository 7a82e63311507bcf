#include <gtest/gtest.h>
#include "CardScene.hpp"
#include "SceneHost.hpp"

TEST(CardScene, DefaultCard)
{
	SceneHost host;
	card::CardSceneResult r = card::buildCardScene(host, card::CardSceneOptions{});
	EXPECT_EQ(r.outlinePoints, 96u);
	EXPECT_EQ(r.vertices, 192u);
	EXPECT_EQ(r.faces, 98u);
	EXPECT_EQ(r.materialParamsApplied, 3);

	ASSERT_EQ(host.objects().size(), 1u);
	const SceneObject& obj = host.object(r.object);
	EXPECT_EQ(obj.name, "BlackCard");
	EXPECT_EQ(obj.meshName, "BlackCardMesh");
	EXPECT_TRUE(obj.mesh.smooth);
	EXPECT_EQ(obj.location, glm::vec3(0.0f));
	EXPECT_EQ(obj.material, "BlackMaterial");
}

TEST(CardScene, MaterialValues)
{
	SceneHost host(InputProfile::Legacy);
	card::buildCardScene(host, card::CardSceneOptions{});

	const SocketMaterial* m = host.findMaterial("BlackMaterial");
	ASSERT_NE(m, nullptr);
	ASSERT_NE(m->color(MaterialParam::BaseColor), nullptr);
	EXPECT_EQ(*m->color(MaterialParam::BaseColor), glm::vec4(0.0f, 0.0f, 0.0f, 1.0f));
	ASSERT_NE(m->value(MaterialParam::Roughness), nullptr);
	EXPECT_FLOAT_EQ(*m->value(MaterialParam::Roughness), 0.6f);
	ASSERT_NE(m->value("Specular"), nullptr);
	EXPECT_FLOAT_EQ(*m->value("Specular"), 0.03f);
}

TEST(CardScene, CameraAndLight)
{
	SceneHost host;
	card::buildCardScene(host, card::CardSceneOptions{});

	ASSERT_EQ(host.cameras().size(), 1u);
	const CameraSpec& cam = host.cameras().front();
	EXPECT_EQ(cam.name, "Camera");
	EXPECT_EQ(cam.location, glm::vec3(0.0f, -1.6f, 0.5f));
	EXPECT_NEAR(cam.rotationEuler.x, glm::radians(70.0f), 1e-6f);
	EXPECT_EQ(cam.rotationEuler.y, 0.0f);
	EXPECT_EQ(cam.rotationEuler.z, 0.0f);

	ASSERT_EQ(host.lights().size(), 1u);
	const LightSpec& light = host.lights().front();
	EXPECT_EQ(light.name, "KeyLight");
	EXPECT_EQ(light.type, LightType::Area);
	EXPECT_EQ(light.location, glm::vec3(1.2f, -0.8f, 1.2f));
	EXPECT_FLOAT_EQ(light.energy, 500.0f);
	EXPECT_FLOAT_EQ(light.size, 0.25f);
}

TEST(CardScene, RebuildClearsScene)
{
	SceneHost host;
	card::buildCardScene(host, card::CardSceneOptions{});
	card::buildCardScene(host, card::CardSceneOptions{});
	EXPECT_EQ(host.objects().size(), 1u);
	EXPECT_EQ(host.materials().size(), 1u);
	EXPECT_EQ(host.cameras().size(), 1u);
	EXPECT_EQ(host.lights().size(), 1u);
}

TEST(CardScene, KeepScene)
{
	SceneHost host;
	card::CardSceneOptions opts;
	card::buildCardScene(host, opts);
	opts.clearScene = false;
	card::CardSceneResult r = card::buildCardScene(host, opts);

	EXPECT_EQ(host.objects().size(), 2u);
	EXPECT_EQ(r.object, 1u);
	EXPECT_EQ(host.object(r.object).material, "BlackMaterial.001");
	EXPECT_EQ(host.cameras().size(), 2u);
	EXPECT_EQ(host.lights().size(), 2u);
}

TEST(CardScene, FlatShading)
{
	SceneHost host;
	card::CardSceneOptions opts;
	opts.shadeSmooth = false;
	card::CardSceneResult r = card::buildCardScene(host, opts);
	EXPECT_FALSE(host.object(r.object).mesh.smooth);
}

TEST(CardScene, HostWithoutSpecularInput)
{
	SceneHost host(std::vector<std::string>{"Base Color", "Roughness"});
	card::CardSceneResult r = card::buildCardScene(host, card::CardSceneOptions{});
	EXPECT_EQ(r.materialParamsApplied, 2);
	EXPECT_EQ(host.object(r.object).material, "BlackMaterial");
}

TEST(CardScene, CustomParams)
{
	SceneHost host;
	card::CardSceneOptions opts;
	opts.params.cornerSteps = 4;
	opts.params.radius = 0.0f;
	card::CardSceneResult r = card::buildCardScene(host, opts);
	EXPECT_EQ(r.outlinePoints, 4u);
	EXPECT_EQ(r.vertices, 8u);
	EXPECT_EQ(r.faces, 6u);
}
