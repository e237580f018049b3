#pragma once

#include <vulkan/vulkan.h>

namespace nodeplumb {

// Compute-to-compute memory barrier (VkMemoryBarrier2, no layout transition).
// Storage writes of earlier dispatches become visible to later dispatches.
void barrierComputeToCompute(VkCommandBuffer cmd);

// UNDEFINED -> GENERAL for a storage image a compute shader is about to write.
// Discards previous contents.
void transitionToComputeWrite(VkCommandBuffer cmd, VkImage image);

} // namespace nodeplumb
