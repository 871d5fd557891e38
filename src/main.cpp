#include <glad/glad.h>
#include <GLFW/glfw3.h>

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>

#include <imgui.h>
#include <backends/imgui_impl_glfw.h>
#include <backends/imgui_impl_opengl3.h>

#include "arbor/Args.hpp"
#include "arbor/Config.hpp"
#include "arbor/Math.hpp"
#include "arbor/Renderer.hpp"
#include "arbor/Scene.hpp"
#include "arbor/Session.hpp"

using namespace arbor;

static void glfwErrorCallback(const int code, const char *msg)
{
    std::cerr << "GLFW error (" << code << "): " << (msg ? msg : "") << "\n";
}

int main(int argc, char *argv[])
{
    std::string configArg;
    uint32_t    seed    = Session::seedFromClock();
    bool        seedSet = false;

    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc)
            configArg = argv[++i];
        else if (arg == "--seed" && i + 1 < argc)
        {
            if (!parseSeed(argv[++i], seed))
            {
                std::cerr << "Invalid seed '" << argv[i] << "' (expected 0..4294967295)\n";
                return 1;
            }
            seedSet = true;
        }
        else if (arg == "--seed-text" && i + 1 < argc)
        {
            seed    = Session::seedFromText(argv[++i]);
            seedSet = true;
        }
        else
        {
            std::cout << "Usage: " << argv[0] << " [--seed N | --seed-text WORD] [--config PATH]\n"
                      << "  --config defaults to data/config/arbor.json; data/config/arbor.example.json lists every key\n";
            return arg == "--help" || arg == "-h" ? 0 : 1;
        }
    }
    const std::string configPath = ConfigLoader::findConfigFile(configArg);

    glfwSetErrorCallback(glfwErrorCallback);

    if (!glfwInit())
    {
        std::cerr << "Failed to init GLFW\n";
        return 1;
    }

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
    glfwWindowHint(GLFW_SAMPLES, 4);

    GLFWwindow *window = glfwCreateWindow(1200, 800, "Arbor", nullptr, nullptr);
    if (!window)
    {
        std::cerr << "Failed to create window\n";
        glfwTerminate();
        return 1;
    }

    glfwMakeContextCurrent(window);
    glfwSwapInterval(1);

    if (!gladLoadGLLoader(reinterpret_cast<GLADloadproc>(glfwGetProcAddress)))
    {
        std::cerr << "Failed to init GLAD\n";
        glfwDestroyWindow(window);
        glfwTerminate();
        return 1;
    }

    // ===== ImGui init =====
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO &io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    ImGui::StyleColorsLight();

    ImGui_ImplGlfw_InitForOpenGL(window, true);
    ImGui_ImplOpenGL3_Init("#version 330");

    // ===== Renderer =====
    Renderer renderer;
    if (!renderer.init())
    {
        std::cerr << "Failed to init renderer\n";
        ImGui_ImplOpenGL3_Shutdown();
        ImGui_ImplGlfw_Shutdown();
        ImGui::DestroyContext();
        glfwDestroyWindow(window);
        glfwTerminate();
        return 1;
    }

    // ===== Session =====
    auto currentCanvas = [&]()
    {
        int w, h;
        glfwGetFramebufferSize(window, &w, &h);
        return Canvas{static_cast<double>(std::max(w, 1)), static_cast<double>(std::max(h, 1))};
    };

    std::unique_ptr<Session> session;
    bool                     reported = false;

    auto startNew = [&](const uint32_t s)
    {
        session  = std::make_unique<Session>(s, currentCanvas(), configPath);
        reported = false;
        const auto &g = session->config().growth;
        std::cout << "Seed " << s << ": seeds=" << g.seedCount << " pBifurcation=" << g.pBifurcation
                  << " expiryThreshold=" << g.expiryThreshold
                  << (session->configLoaded() ? " (overrides from " + configPath + ")" : std::string())
                  << "\n";
    };

    startNew(seedSet ? seed : Session::seedFromClock());

    int  seedInput = static_cast<int>(session->seed());
    bool stepOnce  = false;
    bool showUI    = true;

    // edge-triggered input helpers
    auto keyPressedOnce = [&](const int key) -> bool
    {
        static bool prev[512]{};
        const bool  cur = glfwGetKey(window, key) == GLFW_PRESS;
        const bool  out = cur && !prev[key];
        prev[key]       = cur;
        return out;
    };

    double lastTime  = glfwGetTime();
    double statTimer = 0.0;

    while (!glfwWindowShouldClose(window))
    {
        glfwPollEvents();

        if (glfwGetKey(window, GLFW_KEY_ESCAPE) == GLFW_PRESS)
            glfwSetWindowShouldClose(window, 1);

        const bool typing = io.WantCaptureKeyboard;
        if (!typing)
        {
            if (keyPressedOnce(GLFW_KEY_F1))
                showUI = !showUI;
            if (keyPressedOnce(GLFW_KEY_SPACE))
                session->paused() ? session->resume() : session->pause();
            if (keyPressedOnce(GLFW_KEY_S))
                stepOnce = true;
            if (keyPressedOnce(GLFW_KEY_N))
            {
                startNew(Session::seedFromClock());
                seedInput = static_cast<int>(session->seed());
            }
        }

        // ---- one tick per frame
        if (stepOnce && session->paused())
        {
            session->resume();
            session->update();
            session->pause();
        }
        else
        {
            session->update();
        }
        stepOnce = false;

        if (session->finished() && !reported)
        {
            reported = true;
            std::cout << "Seed " << session->seed() << " finished after " << session->model().ticks()
                      << " ticks, " << session->model().lineCount() << " lines\n";
        }

        // ---- geometry
        const Scene scene = buildScene(session->model(), session->config().style);
        renderer.uploadBands(scene.bands);
        renderer.uploadLines(scene.lines);

        int w, h;
        glfwGetFramebufferSize(window, &w, &h);
        renderer.resize(w, h);

        const Canvas &canvas = session->canvas();
        renderer.setProjection(ortho(0.f, static_cast<float>(canvas.width), static_cast<float>(canvas.height), 0.f));

        // ---- Render scene
        renderer.clear();
        renderer.drawBands();
        renderer.drawLines();

        // ---- UI
        if (showUI)
        {
            ImGui_ImplOpenGL3_NewFrame();
            ImGui_ImplGlfw_NewFrame();
            ImGui::NewFrame();

            ImGui::Begin("Arbor");

            ImGui::Text("F1 toggle UI | SPACE pause | S step | N new");
            ImGui::Separator();

            if (ImGui::Button(session->paused() ? "Run" : "Pause"))
                session->paused() ? session->resume() : session->pause();
            ImGui::SameLine();
            if (ImGui::Button("Step"))
                stepOnce = true;
            ImGui::SameLine();
            if (ImGui::Button("New"))
            {
                startNew(Session::seedFromClock());
                seedInput = static_cast<int>(session->seed());
            }

            ImGui::InputInt("Seed", &seedInput);
            if (ImGui::Button("Restart with seed"))
                startNew(static_cast<uint32_t>(std::max(seedInput, 0)));

            bool showBands = renderer.showBands();
            if (ImGui::Checkbox("Show bands", &showBands))
                renderer.setShowBands(showBands);

            ImGui::Separator();

            const GrowthModel &model = session->model();
            ImGui::Text("Tick: %llu", static_cast<unsigned long long>(model.ticks()));
            ImGui::Text("Active lines: %d / %zu", model.activeLineCount(), model.lineCount());
            ImGui::Text("%s", session->finished() ? "Finished" : (session->paused() ? "Paused" : "Growing"));

            if (ImGui::TreeNode("Configuration"))
            {
                const auto &g = session->config().growth;
                const auto &s = session->config().style;
                ImGui::Text("seedCount: %d", g.seedCount);
                ImGui::Text("pBifurcation: %.4f", g.pBifurcation);
                ImGui::Text("expiryThreshold: %.5f", g.expiryThreshold);
                ImGui::Text("maxRectWidth: %.1f", s.maxRectWidth);
                ImGui::Text("hue: %.1f +/- %.1f", s.rectBaseHue, s.rectHueVariation / 2.0);
                ImGui::Text("saturation %.1f  lightness %.1f  alpha %.2f", s.rectSaturation, s.rectLightness,
                            s.rectAlpha);
                ImGui::Text("gradients: %s", s.useGradients ? "on" : "off");
                ImGui::TreePop();
            }

            ImGui::End();

            ImGui::Render();
            ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
        }

        // swap LAST
        glfwSwapBuffers(window);

        // console stats ~1sec
        const double now = glfwGetTime();
        statTimer += now - lastTime;
        lastTime = now;
        if (statTimer > 1.0)
        {
            statTimer = 0.0;
            std::cout << "Seed: " << session->seed()
                      << " | Tick: " << session->model().ticks()
                      << " | Active: " << session->model().activeLineCount()
                      << " | Lines: " << session->model().lineCount()
                      << (session->paused() ? " [PAUSED]" : "")
                      << (session->finished() ? " [DONE]" : "")
                      << "\n";
        }
    }

    renderer.shutdown();

    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext();

    glfwDestroyWindow(window);
    glfwTerminate();
    return 0;
}
