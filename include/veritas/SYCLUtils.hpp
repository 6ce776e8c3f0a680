/**
 * @file SYCLUtils.hpp
 * @brief Small helpers for launching and writing SYCL kernels.
 *
 */

#ifndef VERITAS_SYCLUTILS_HPP
#define VERITAS_SYCLUTILS_HPP

#include <sycl/sycl.hpp>
#include <cstdint>
#include <new>
#include <type_traits>
#include <vector>

namespace veritas
{

/**
 * @brief Supported memory locations for kernel buffers.
 */
enum class MemoryLocation
{
    HOST,   ///< Shared USM, readable from host and device
    DEVICE  ///< Device USM
};

} // namespace veritas

namespace veritas::sycl_utils
{

/**
 * @brief Owning USM array bound to a queue.
 *
 * Allocates `size` elements with malloc_shared (HOST) or malloc_device
 * (DEVICE) and frees them on destruction. Converts implicitly to a raw
 * pointer so it can be captured by value inside kernels.
 */
template <typename value_t>
class SyclArray
{

private:

    sycl::queue& m_queue;
    value_t*     m_p_data {nullptr};
    uint64_t     m_size {0};

public:

    /**
     * @brief Allocate an uninitialized array.
     *
     * @throws std::bad_alloc if the USM allocation fails.
     */
    SyclArray(sycl::queue& queue, uint64_t size, MemoryLocation loc)
        : m_queue(queue), m_size(size)
    {
        if (loc == MemoryLocation::HOST)
        {
            m_p_data = sycl::malloc_shared<value_t>(size, m_queue);
        }
        else
        {
            m_p_data = sycl::malloc_device<value_t>(size, m_queue);
        }
        if (m_p_data == nullptr)
        {
            throw std::bad_alloc();
        }
    }

    /**
     * @brief Allocate an array and copy @p values into it.
     *
     * @throws std::bad_alloc if the USM allocation fails.
     */
    SyclArray(sycl::queue& queue,
        const std::vector<value_t>& values,
        MemoryLocation loc)
        : SyclArray(queue, values.size(), loc)
    {
        if (!values.empty())
        {
            m_queue.memcpy(m_p_data,
                values.data(), sizeof(value_t) * m_size).wait();
        }
    }

    SyclArray(const SyclArray&) = delete;
    SyclArray& operator=(const SyclArray&) = delete;

    ~SyclArray()
    {
        sycl::free(m_p_data, m_queue);
    }

    /// Copy the whole array back into a host vector.
    std::vector<value_t> to_host() const
    {
        std::vector<value_t> out(m_size);
        if (m_size > 0)
        {
            m_queue.memcpy(out.data(),
                m_p_data, sizeof(value_t) * m_size).wait();
        }
        return out;
    }

    uint64_t size() const { return m_size; }

    operator value_t*() { return m_p_data; }
    operator const value_t*() const { return m_p_data; }
};

/**
 * @brief Safe isnan wrapper that is valid for both floating and integer types.
 */
template <typename value_t>
inline bool is_nan(value_t v)
{
    if constexpr (std::is_floating_point_v<value_t>)
    {
        return sycl::isnan(v);
    }
    else
    {
        (void)v;
        return false;
    }
}

} // namespace veritas::sycl_utils

#endif // VERITAS_SYCLUTILS_HPP
