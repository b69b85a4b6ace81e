#pragma once

#include <core/error/mesh_error.h>
#include <core/process/process_runner.h>
#include <exception>
#include <string>

namespace tailkit::core {

// Returns the captured stdout of a finished command.
// Throws MeshError::CommandFailed (stderr as detail) for a non-zero exit and
// MeshError::InvalidOutput when stdout is not valid UTF-8.
std::string TakeOutput(ProcessResult&& result);

// Maps any failure raised while running an operation onto the closed
// MeshError taxonomy:
//   MeshError                        -> unchanged
//   DecodeError, nlohmann exceptions -> InvalidOutput
//   std::system_error, anything else -> ExecutionFailed
MeshError Classify(std::exception_ptr error);

} // namespace tailkit::core
