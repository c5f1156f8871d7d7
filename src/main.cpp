#include "gravsim/simulation.hpp"
#include "gravsim/command_line.hpp"
#include "gravsim/framebuffer.hpp"
#include "gravsim/renderer.hpp"
#include "gravsim/view_state.hpp"
#include "gravsim/error_handling.hpp"
#include <GLFW/glfw3.h>
#include <chrono>
#include <iostream>
#include <thread>

using namespace gravsim;

// Per-window state reached from the GLFW callbacks
struct AppState {
    Simulation* simulation = nullptr;
    ViewState* view = nullptr;
    Framebuffer* framebuffer = nullptr;
    Renderer* renderer = nullptr;
    RenderConfig render_config;
};

// Callbacks
void keyCallback(GLFWwindow* window, int key, int scancode, int action, int mods) {
    if (action == GLFW_RELEASE) return;
    auto* app = static_cast<AppState*>(glfwGetWindowUserPointer(window));
    ViewState& view = *app->view;
    bool first_press = (action == GLFW_PRESS);

    switch (key) {
        case GLFW_KEY_ESCAPE:
            glfwSetWindowShouldClose(window, GLFW_TRUE);
            break;
        case GLFW_KEY_SPACE:
            if (first_press) view.togglePause();
            break;
        case GLFW_KEY_X:
            if (first_press) view.toggleTrails();
            break;
        case GLFW_KEY_C:
            app->simulation->step(view.getTimescale());
            break;
        case GLFW_KEY_Q:
            view.zoomOut();
            app->framebuffer->clear();
            break;
        case GLFW_KEY_E:
            view.zoomIn();
            app->framebuffer->clear();
            break;
        case GLFW_KEY_W:
            view.pan(0, -1);
            app->framebuffer->clear();
            break;
        case GLFW_KEY_S:
            view.pan(0, 1);
            app->framebuffer->clear();
            break;
        case GLFW_KEY_A:
            view.pan(-1, 0);
            app->framebuffer->clear();
            break;
        case GLFW_KEY_D:
            view.pan(1, 0);
            app->framebuffer->clear();
            break;
        case GLFW_KEY_R:
            if (first_press) {
                view.resetCamera();
                app->framebuffer->clear();
            }
            break;
        case GLFW_KEY_UP:
            view.increaseMoveScale();
            break;
        case GLFW_KEY_DOWN:
            view.decreaseMoveScale();
            break;
        case GLFW_KEY_LEFT:
            view.slowDown();
            break;
        case GLFW_KEY_RIGHT:
            view.speedUp();
            break;
        case GLFW_KEY_P:
            std::cout << "\n\n\n";
            app->simulation->printBodies(std::cout);
            printConfiguration(std::cout, view, app->render_config);
            break;
        case GLFW_KEY_O:
            std::cout << "SAVING TO FILE" << std::endl;
            app->simulation->saveState();
            break;
    }
}

void framebufferSizeCallback(GLFWwindow* window, int width, int height) {
    auto* app = static_cast<AppState*>(glfwGetWindowUserPointer(window));
    app->renderer->onResize(width, height);
}

int main(int argc, char* argv[]) {
    CommandLineOptions options;
    Simulation simulation;

    try {
        options = parseCommandLine(argc, argv);
        if (options.show_help) {
            printUsage(std::cout);
            return 0;
        }

        simulation.initialize(options.config);
    } catch (const ParseException& e) {
        std::cerr << "ERROR: save file not correctly formatted: " << e.what() << std::endl;
        return 1;
    } catch (const ValidationException& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        printUsage(std::cerr);
        return 1;
    } catch (const IOException& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    }

    // Keep the starting configuration so the run can be replayed
    simulation.saveState();

    const SimulationConfig& config = simulation.getConfig();
    RenderConfig render_config;
    ViewState view(config.initial_timescale);

    std::cout << "Gravity Simulation\n";
    std::cout << "Body count: " << simulation.getLiveCount() << "\n";
    printUsage(std::cout);

    try {
        // Initialize GLFW
        if (!glfwInit()) {
            throw std::runtime_error("Failed to initialize GLFW");
        }

        // Create window
        glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
        glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
        glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
        glfwWindowHint(GLFW_RESIZABLE, GLFW_FALSE);

        GLFWwindow* window = glfwCreateWindow(render_config.window_width, render_config.window_height,
                                              "Gravity Simulation", nullptr, nullptr);
        if (!window) {
            glfwTerminate();
            throw std::runtime_error("Failed to create GLFW window");
        }

        glfwMakeContextCurrent(window);
        glfwSwapInterval(0);  // Pacing comes from the frame delay

        Renderer renderer;
        renderer.initialize(render_config.window_width, render_config.window_height);

        Framebuffer framebuffer(render_config.window_width, render_config.window_height);

        AppState app_state;
        app_state.simulation = &simulation;
        app_state.view = &view;
        app_state.framebuffer = &framebuffer;
        app_state.renderer = &renderer;
        app_state.render_config = render_config;
        glfwSetWindowUserPointer(window, &app_state);

        // Set callbacks
        glfwSetKeyCallback(window, keyCallback);
        glfwSetFramebufferSizeCallback(window, framebufferSizeCallback);

        const auto frame_delay = std::chrono::milliseconds(config.frame_delay_ms);

        // Main loop: input, step, draw
        while (!glfwWindowShouldClose(window)) {
            glfwPollEvents();

            simulation.update(view);

            composeFrame(framebuffer, simulation.getBodies(), view, config.pixel_decay_rate);
            renderer.present(framebuffer);
            glfwSwapBuffers(window);

            std::this_thread::sleep_for(frame_delay);
        }

        // Cleanup
        renderer.cleanup();
        glfwDestroyWindow(window);
        glfwTerminate();

    } catch (const OpenGLException& e) {
        std::cerr << "OpenGL Error: " << e.what() << std::endl;
        glfwTerminate();
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        glfwTerminate();
        return 1;
    }

    return 0;
}
