/**
 * @file SYCLQueue.cpp
 * @brief Global SYCL queue definition.
 */

#include "veritas/SYCLQueue.hpp"

namespace veritas
{

sycl::queue g_sycl_queue{ sycl::default_selector_v };

bool device_supports_fp64()
{
    static const bool supported =
        g_sycl_queue.get_device().has(sycl::aspect::fp64);
    return supported;
}

} // namespace veritas
