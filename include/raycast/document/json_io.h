// raycast - scene exporter for the RayCast ray tracer
// Copyright (c) 2025 raycast Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "raycast/core/result.h"
#include "raycast/document/scene_document.h"

namespace raycast::document {

// Keys keep schema order in the written file
using Json = nlohmann::ordered_json;

Json ToJson(const Material& material);
Json ToJson(const Primitive& primitive);
Json ToJson(const Light& light);
Json ToJson(const Camera& camera);
Json ToJson(const SceneDocument& document);

// indent < 0 writes a single line. Invalid UTF-8 in names becomes U+FFFD.
std::string DumpDocument(const SceneDocument& document, int indent = 2);

/**
 * @brief Strict reader for exported documents
 *
 * Every field the writer emits is required. Unknown type tags, ill-typed
 * values and broken mesh or box invariants are reported as errors naming the
 * offending entry.
 */
core::Result<SceneDocument> ParseDocument(const Json& json);
core::Result<SceneDocument> ReadDocument(const std::filesystem::path& path);

} // namespace raycast::document
