#include <glad/gl.h>

#include <GLFW/glfw3.h>

#include "PreviewHost.hpp"

#include "Camera.hpp"
#include "Mesh.hpp"
#include "Shader.hpp"
#include "Util.hpp"

#include <glm/gtc/matrix_transform.hpp>

#include <string>
#include <vector>

namespace {

struct PreviewWindow {
    GLFWwindow* window = nullptr;
    int w = cfg::PREVIEW_WIDTH;
    int h = cfg::PREVIEW_HEIGHT;
};

struct DrawItem {
    Mesh mesh;
    glm::mat4 model = glm::mat4(1.0f);
    glm::vec3 baseColor = glm::vec3(0.8f);
    float roughness = 0.5f;
    float specular = 0.5f;
};

void glfwErrorCallback(int error, const char* description) {
    util::logError(std::string("GLFW error ") + std::to_string(error) + ": " + (description ? description : ""));
}

void framebufferSizeCallback(GLFWwindow* window, int w, int h) {
    if (w <= 0 || h <= 0) return;
    auto* pw = (PreviewWindow*)glfwGetWindowUserPointer(window);
    if (!pw) return;
    pw->w = w;
    pw->h = h;
    glViewport(0, 0, w, h);
}

void keyCallback(GLFWwindow* window, int key, int scancode, int action, int mods) {
    (void)scancode;
    (void)mods;
    if (action == GLFW_PRESS && key == GLFW_KEY_ESCAPE) {
        glfwSetWindowShouldClose(window, GLFW_TRUE);
    }
}

} // namespace

PreviewHost::PreviewHost(InputProfile profile) : SceneHost(profile) {}

bool PreviewHost::run(int width, int height, const std::string& title) {
    glfwSetErrorCallback(glfwErrorCallback);

    if (!glfwInit()) {
        util::logError("Failed to init GLFW");
        return false;
    }

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
#if defined(__APPLE__)
    glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GLFW_TRUE);
#endif
    glfwWindowHint(GLFW_SAMPLES, 4);

    PreviewWindow pw;
    pw.w = width;
    pw.h = height;
    pw.window = glfwCreateWindow(width, height, title.c_str(), nullptr, nullptr);
    if (!pw.window) {
        util::logError("Failed to create window");
        glfwTerminate();
        return false;
    }

    glfwMakeContextCurrent(pw.window);
    glfwSwapInterval(1);

    if (!gladLoadGL((GLADloadfunc)glfwGetProcAddress)) {
        util::logError("Failed to load OpenGL via glad");
        glfwDestroyWindow(pw.window);
        glfwTerminate();
        return false;
    }

    glfwSetWindowUserPointer(pw.window, &pw);
    glfwSetFramebufferSizeCallback(pw.window, framebufferSizeCallback);
    glfwSetKeyCallback(pw.window, keyCallback);

    util::logInfo(std::string("OpenGL: ") + (const char*)glGetString(GL_VERSION));

    // Some platforms won't call the framebuffer callback immediately
    int fbw = 0, fbh = 0;
    glfwGetFramebufferSize(pw.window, &fbw, &fbh);
    pw.w = fbw > 0 ? fbw : pw.w;
    pw.h = fbh > 0 ? fbh : pw.h;

    bool ok = true;
    {
        // GL objects must go before the context does.
        Shader shader;
        try {
            shader = Shader(cfg::CARD_VERT_SHADER, cfg::CARD_FRAG_SHADER);
        } catch (const std::exception& e) {
            util::logError(e.what());
            ok = false;
        }

        std::vector<DrawItem> items;
        if (ok) {
            items.reserve(objects().size());
            for (const SceneObject& obj : objects()) {
                DrawItem item;
                item.mesh = Mesh::fromSolid(obj.mesh);
                if (!item.mesh.valid()) {
                    util::logWarn("Skipping empty object: " + obj.name);
                    continue;
                }
                item.model = glm::translate(glm::mat4(1.0f), obj.location);
                if (const SocketMaterial* mat = findMaterial(obj.material)) {
                    if (const glm::vec4* c = mat->color(MaterialParam::BaseColor)) item.baseColor = glm::vec3(*c);
                    if (const float* r = mat->value(MaterialParam::Roughness)) item.roughness = *r;
                    if (const float* s = mat->value(MaterialParam::Specular)) item.specular = *s;
                }
                items.push_back(std::move(item));
            }
            util::logInfo("Preview objects=" + std::to_string(items.size()));
        }

        SceneCamera cam(cameras().empty() ? CameraSpec{} : cameras().front());
        LightSpec light = lights().empty() ? LightSpec{} : lights().front();

        glEnable(GL_DEPTH_TEST);
        glEnable(GL_MULTISAMPLE);
        glEnable(GL_CULL_FACE);
        glCullFace(GL_BACK);
        glFrontFace(GL_CCW);

        while (ok && !glfwWindowShouldClose(pw.window)) {
            glViewport(0, 0, pw.w, pw.h);
            glClearColor(0.15f, 0.15f, 0.18f, 1.0f);
            glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);

            glm::mat4 V = cam.view();
            glm::mat4 P = cam.projection((float)pw.w / (float)pw.h);

            shader.use();
            shader.setMat4("view", V);
            shader.setMat4("projection", P);
            shader.setVec3("cameraPos", cam.location);
            shader.setVec3("lightPos", light.location);
            shader.setVec3("lightColor", light.color);
            shader.setFloat("lightIntensity", light.energy * cfg::PREVIEW_LIGHT_SCALE);

            for (const DrawItem& item : items) {
                shader.setMat4("model", item.model);
                shader.setMat3("normalMatrix", glm::transpose(glm::inverse(glm::mat3(item.model))));
                shader.setVec3("baseColor", item.baseColor);
                shader.setFloat("roughness", item.roughness);
                shader.setFloat("specular", item.specular);
                item.mesh.draw();
            }

            glfwSwapBuffers(pw.window);
            glfwPollEvents();
        }
    }

    glfwDestroyWindow(pw.window);
    glfwTerminate();
    return ok;
}
