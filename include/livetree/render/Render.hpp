#pragma once

#include <livetree/render/ElementRender.hpp>
#include <livetree/render/ListRender.hpp>
#include <livetree/render/NodesRender.hpp>

#include <memory>
#include <utility>

#include <livetree/render/Render.inl>
