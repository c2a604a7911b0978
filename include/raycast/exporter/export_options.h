// raycast - scene exporter for the RayCast ray tracer
// Copyright (c) 2025 raycast Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

namespace raycast::exporter {

/**
 * @brief Switches recognized by a single export call
 */
struct ExportOptions {
    bool ExportMeshes = true;     // skip mesh objects entirely when false
    bool ExportLights = true;     // skip light objects entirely when false
    bool ExportMaterials = true;  // every primitive gets the default material when false
};

} // namespace raycast::exporter
