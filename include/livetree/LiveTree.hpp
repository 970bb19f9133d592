#pragma once

#include <livetree/core/Error.hpp>
#include <livetree/core/RuntimeFlags.hpp>

#include <livetree/platform/Document.hpp>
#include <livetree/platform/LiveNode.hpp>
#include <livetree/platform/TreeSnapshot.hpp>

#include <livetree/dom/AttributeList.hpp>
#include <livetree/dom/ElementStatus.hpp>
#include <livetree/dom/KeyedList.hpp>
#include <livetree/dom/Nodes.hpp>

#include <livetree/render/Render.hpp>

#include <livetree/component/App.hpp>
#include <livetree/component/Checklist.hpp>
#include <livetree/component/Component.hpp>
#include <livetree/component/UpdateQueue.hpp>
