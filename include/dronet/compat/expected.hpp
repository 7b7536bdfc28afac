/**
* @file expected.hpp
 * @brief dronet_detail::expected / unexpected, backed by std::expected or tl::expected.
 *
 * Packet-path operations (forward, flood handling, control-packet building,
 * channel send/recv) report failures as values through this alias. The build
 * defines DRONET_USE_TL_EXPECTED when the standard library lacks <expected>;
 * the header-only backport (https://github.com/TartanLlama/expected) is then
 * required.
 */
#pragma once

#if defined(DRONET_USE_TL_EXPECTED)
  #include <tl/expected.hpp>
  #define DRONET_EXPECTED_NS tl
#else
  #include <expected>
  #define DRONET_EXPECTED_NS std
#endif

namespace dronet_detail {
    template<class T, class E> using expected   = DRONET_EXPECTED_NS::expected<T, E>;
    template<class E>          using unexpected = DRONET_EXPECTED_NS::unexpected<E>;
}

#undef DRONET_EXPECTED_NS
