#include <gtest/gtest.h>
#include "Camera.hpp"

#include <glm/gtc/constants.hpp>

#include <cmath>

static void ExpectNear(const glm::vec3& a, const glm::vec3& b, float eps = 1e-5f)
{
	EXPECT_NEAR(a.x, b.x, eps);
	EXPECT_NEAR(a.y, b.y, eps);
	EXPECT_NEAR(a.z, b.z, eps);
}

TEST(Camera, DefaultLooksTowardsTheCard)
{
	SceneCamera cam{CameraSpec{}};
	float a = glm::radians(70.0f);
	ExpectNear(cam.forward(), glm::vec3(0.0f, std::sin(a), -std::cos(a)));
	ExpectNear(cam.up(), glm::vec3(0.0f, std::cos(a), std::sin(a)));
}

TEST(Camera, ViewMapsLocationToOrigin)
{
	SceneCamera cam{CameraSpec{}};
	glm::vec4 p = cam.view() * glm::vec4(cam.location, 1.0f);
	ExpectNear(glm::vec3(p), glm::vec3(0.0f));
}

TEST(Camera, OriginIsInFront)
{
	SceneCamera cam{CameraSpec{}};
	glm::vec4 p = cam.view() * glm::vec4(0.0f, 0.0f, 0.0f, 1.0f);
	EXPECT_LT(p.z, 0.0f);
	// Looking at the card from below its centre line: origin lands near the
	// vertical centre of the view.
	EXPECT_NEAR(p.x, 0.0f, 1e-5f);
}

TEST(Camera, VerticalFov)
{
	SceneCamera cam{CameraSpec{}};
	float h = glm::radians(cfg::CAMERA_HFOV_DEG);
	EXPECT_NEAR(cam.verticalFovRad(1.0f), h, 1e-6f);
	EXPECT_LT(cam.verticalFovRad(2.0f), h);
	EXPECT_NEAR(cam.verticalFovRad(2.0f), 2.0f * std::atan(std::tan(0.5f * h) / 2.0f), 1e-6f);
	EXPECT_NEAR(cam.verticalFovRad(0.5f), h, 1e-6f);
}

TEST(Camera, EulerOrderIsXThenYThenZ)
{
	glm::mat4 R = eulerXYZ(glm::vec3(glm::half_pi<float>(), 0.0f, glm::half_pi<float>()));
	ExpectNear(glm::vec3(R * glm::vec4(1, 0, 0, 0)), glm::vec3(0, 1, 0));
	ExpectNear(glm::vec3(R * glm::vec4(0, 1, 0, 0)), glm::vec3(0, 0, 1));
	ExpectNear(glm::vec3(R * glm::vec4(0, 0, 1, 0)), glm::vec3(1, 0, 0));
}

TEST(Camera, ObjectTransformTranslatesAfterRotating)
{
	glm::mat4 M = objectTransform(glm::vec3(1, 2, 3), glm::vec3(0.0f, 0.0f, glm::half_pi<float>()));
	ExpectNear(glm::vec3(M * glm::vec4(1, 0, 0, 1)), glm::vec3(1, 3, 3));
}
