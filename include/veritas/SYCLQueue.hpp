/**
 * @file SYCLQueue.hpp
 * @brief Declaration of the global SYCL queue.
 *
 * This header declares a global `sycl::queue` variable that is shared by
 * every kernel launched by the library, avoiding the need to pass it
 * explicitly between layers.
 */

#ifndef VERITAS_SYCLQUEUE_HPP
#define VERITAS_SYCLQUEUE_HPP

#include <sycl/sycl.hpp>

namespace veritas
{

/**
 * @brief Global SYCL queue used for all device work.
 */
extern sycl::queue g_sycl_queue;

/**
 * @brief Whether the device behind g_sycl_queue can run double kernels.
 *
 * Network parameters are stored as double, so kernels are only launched
 * on devices exposing the fp64 aspect.
 */
bool device_supports_fp64();

} // namespace veritas

#endif // VERITAS_SYCLQUEUE_HPP
