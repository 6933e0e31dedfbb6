#pragma once

#include "Concepts.hpp"

namespace DnD {

class BaseException;
class Device;
class DragDropList;
class DragDropStore;
class DragSession;
class Environment;
class Instance;
class InterfaceSystem;
class Logger;
class NotFoundException;
class VulkanResultException;
class Window;
class WindowException;
struct DragDropOptions;
struct DragIndices;
struct WindowProperties;

template <IsNumber T> struct Extent;

} // namespace DnD
