#pragma once

#include <GLFW/glfw3.h>

namespace chatviz {
namespace EventDispatch {

// Accumulates wheel offsets on the GuiInterface stored as the window user pointer.
void custom_glfw_scroll_callback(GLFWwindow* window, double xoffset, double yoffset);
void glfw_error_callback(int error, const char* description);

} // namespace EventDispatch
} // namespace chatviz
