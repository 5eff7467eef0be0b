#pragma once

// This doesn't actually help with complex matrices as std::complex has no NaN
#ifdef DEBUG
#define EIGEN_INITIALIZE_MATRICES_BY_NAN
#endif

#include <Eigen/Dense>
#include <unsupported/Eigen/CXX11/Tensor>

#include <cassert>
#include <complex>
#include <numeric>

using Index = Eigen::Index;

namespace sn {

template <int N> using BN = Eigen::Tensor<bool, N>;

template <int N> using ReN = Eigen::Tensor<float, N>;
using Re1 = ReN<1>;
using Re2 = ReN<2>;
using Re3 = ReN<3>;
using Re4 = ReN<4>;

using Cx = std::complex<float>;

template <int N> using CxN = Eigen::Tensor<Cx, N>;
using Cx2 = CxN<2>;
using Cx3 = CxN<3>;
using Cx4 = CxN<4>;
using Cx5 = CxN<5>;

// Useful shorthands
template <int Rank> using Sz = typename Eigen::DSizes<Index, Rank>;
using Sz1 = Sz<1>;
using Sz3 = Sz<3>;
using Sz4 = Sz<4>;

/*
 * DSizes and std::array do not convert to each other, and HDF5 wants the latter
 */
template <int N> auto ToArray(Sz<N> const &sz) -> std::array<Index, N>
{
  std::array<Index, N> a;
  std::copy(sz.begin(), sz.end(), a.begin());
  return a;
}

template <typename T, int N, typename... Args> decltype(auto) AddFront(Eigen::DSizes<T, N> const &back, Args... toAdd)
{
  static_assert(sizeof...(Args) > 0);
  Eigen::DSizes<T, sizeof...(Args)>     front{{toAdd...}};
  Eigen::DSizes<T, sizeof...(Args) + N> out;

  std::copy_n(front.begin(), sizeof...(Args), out.begin());
  std::copy_n(back.begin(), N, out.begin() + sizeof...(Args));
  return out;
}

template <size_t N, typename T> auto FirstN(T const &sz) -> Eigen::DSizes<typename T::value_type, N>
{
  assert(N <= sz.size());
  Eigen::DSizes<typename T::value_type, N> first;
  std::copy_n(sz.begin(), N, first.begin());
  return first;
}

template <size_t N> Index Product(std::array<Index, N> const &indices)
{
  return std::accumulate(indices.begin(), indices.end(), 1L, std::multiplies<Index>());
}

template <int N> Index Product(Sz<N> const &indices)
{
  return std::accumulate(indices.begin(), indices.end(), 1L, std::multiplies<Index>());
}

} // namespace sn
