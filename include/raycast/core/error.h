// raycast - scene exporter for the RayCast ray tracer
// Copyright (c) 2025 raycast Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <stdexcept>
#include <string>

namespace raycast
{

/**
 * @brief Base exception class for raycast errors
 */
class RaycastError : public std::runtime_error
{
public:
    explicit RaycastError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Malformed host scene data (broken accessors, dangling references)
 */
class SceneError : public RaycastError
{
public:
    explicit SceneError(const std::string& message) : RaycastError("Scene error: " + message) {}
};

/**
 * @brief Exported document does not match the output schema
 */
class DocumentError : public RaycastError
{
public:
    explicit DocumentError(const std::string& message) : RaycastError("Document error: " + message) {}
};

} // namespace raycast
