// raycast - scene exporter for the RayCast ray tracer
// Copyright (c) 2025 raycast Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <filesystem>

#include "raycast/core/result.h"
#include "raycast/document/scene_document.h"
#include "raycast/exporter/export_options.h"
#include "raycast/scene/scene.h"

namespace raycast::exporter {

/**
 * @brief Build the document for one export
 *
 * Walks the scene once in host order. Never fails: unusable objects are
 * approximated or skipped.
 */
document::SceneDocument Serialize(const scene::Scene& scene, const ExportOptions& options);

/**
 * @brief Write a document, creating the parent directory if needed
 *
 * The file is written next to the destination and renamed into place, so a
 * failed write leaves no partial document behind.
 */
core::Result<void> WriteDocument(const document::SceneDocument& document,
                                 const std::filesystem::path& path,
                                 int indent = 2);

// Serialize + WriteDocument
core::Result<void> ExportScene(const scene::Scene& scene,
                               const ExportOptions& options,
                               const std::filesystem::path& path,
                               int indent = 2);

} // namespace raycast::exporter
