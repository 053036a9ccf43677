#pragma once

/// Convenience umbrella header for the Kodiak library.

#include <kodiak/core/bool.hpp>
#include <kodiak/core/column.hpp>
#include <kodiak/core/error.hpp>
#include <kodiak/core/schema.hpp>
#include <kodiak/frame/frame.hpp>
#include <kodiak/frame/group_by.hpp>
#include <kodiak/frame/group_key.hpp>
#include <kodiak/frame/locator.hpp>
#include <kodiak/frame/metadata.hpp>
#include <kodiak/frame/unsupported.hpp>
#include <kodiak/ir/builder.hpp>
#include <kodiak/ir/node.hpp>
#include <kodiak/ir/types.hpp>
#include <kodiak/runtime/csv.hpp>
#include <kodiak/runtime/interpreter.hpp>
#include <kodiak/runtime/ops.hpp>
#include <kodiak/runtime/table.hpp>
