#pragma once

#include "types.hpp"

namespace sn {

template <typename T> typename T::Scalar Sum(T const &a)
{
  Eigen::TensorFixedSize<typename T::Scalar, Eigen::Sizes<>> s;
  s = a.sum();
  return s();
}

template <typename T, typename U> inline decltype(auto) Dot(T const &a, U const &b)
{
  using Scalar = typename std::remove_reference<T>::type::Scalar;
  Eigen::TensorFixedSize<Scalar, Eigen::Sizes<>> d0;
  d0 = (a * b.conjugate()).sum();
  return d0();
}

template <typename T> inline decltype(auto) Norm2(T const &a) { return std::real(Dot(a, a)); }
template <typename T> inline decltype(auto) Norm(T const &a) { return std::sqrt(Norm2(a)); }

template <typename T> inline auto Count(T const &mask) -> Index
{
  Eigen::TensorFixedSize<Index, Eigen::Sizes<>> c;
  c = mask.template cast<Index>().sum();
  return c();
}

} // namespace sn
