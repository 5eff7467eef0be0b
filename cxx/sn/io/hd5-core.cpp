#include "hd5-core.hpp"

#include "../log/log.hpp"
#include "../types.hpp"

#include <hdf5.h>

namespace sn {
namespace HD5 {

namespace {

struct complex_f
{
  float r;
  float i;
};

hid_t complex_fid, alternate_complex_fid;

} // namespace

template <> hid_t type_impl(type_tag<Index>, bool const) { return H5T_NATIVE_LONG; }

template <> hid_t type_impl(type_tag<float>, bool const) { return H5T_NATIVE_FLOAT; }

template <> hid_t type_impl(type_tag<double>, bool const) { return H5T_NATIVE_DOUBLE; }

template <> hid_t type_impl(type_tag<std::complex<float>>, bool const alt)
{
  if (alt) {
    return alternate_complex_fid;
  } else {
    return complex_fid;
  }
}

herr_t ConvertFloatComplex(hid_t, hid_t, H5T_cdata_t *, size_t n, size_t, size_t, void *buf, void *, hid_t)
{
  // HDF5 wants the conversion in place, so go backwards to avoid overwriting values
  float *src = (float *)buf;
  Cx    *tgt = (Cx *)buf;
  for (Index ii = n - 1; ii >= 0; ii--) {
    tgt[ii] = Cx(src[ii]);
  }
  return 0;
}

void Init()
{
  static bool NeedsInit = true;

  if (NeedsInit) {
    auto err = H5open();
    err = H5Eset_auto(H5E_DEFAULT, nullptr, nullptr);
    if (err < 0) { throw Log::Failure("HD5", "Could not initialise HDF5, code: {}", err); }
    NeedsInit = false;
    hid_t fid = type_impl(type_tag<float>{});

    complex_fid = H5Tcreate(H5T_COMPOUND, sizeof(complex_f));
    CheckedCall(H5Tinsert(complex_fid, "r", HOFFSET(complex_f, r), fid), "inserting .r");
    CheckedCall(H5Tinsert(complex_fid, "i", HOFFSET(complex_f, i), fid), "inserting .i");
    H5Tregister(H5T_PERS_HARD, "real->complex", H5T_NATIVE_FLOAT, complex_fid, ConvertFloatComplex);

    alternate_complex_fid = H5Tcreate(H5T_COMPOUND, sizeof(complex_f));
    CheckedCall(H5Tinsert(alternate_complex_fid, "real", HOFFSET(complex_f, r), fid), "inserting .real");
    CheckedCall(H5Tinsert(alternate_complex_fid, "imag", HOFFSET(complex_f, i), fid), "inserting .imag");
    H5Tregister(H5T_PERS_HARD, "real->complex", H5T_NATIVE_FLOAT, alternate_complex_fid, ConvertFloatComplex);

    Log::Debug("HD5", "Initialised HDF5");
  }
}

// Saves the error at the top (bottom) of the stack in the supplied string
herr_t ErrorWalker(unsigned n, const H5E_error2_t *err_desc, void *data)
{
  std::string *str = (std::string *)data;
  if (n == 0) { *str = fmt::format("{}", err_desc->desc); }
  return 0;
}

std::string GetError()
{
  std::string error_string;
  hid_t const stack = H5Eget_current_stack();
  H5Ewalk(stack, H5E_WALK_UPWARD, &ErrorWalker, (void *)&error_string);
  H5Eclose_stack(stack);
  return error_string;
}

void CheckedCall(herr_t status, std::string const &msg)
{
  if (status < 0) { throw Log::Failure("HD5", "Error {}. Status {}. Error: {}", msg, status, GetError()); }
}

auto Exists(hid_t const parent, std::string const &name) -> bool { return (H5Lexists(parent, name.c_str(), H5P_DEFAULT) > 0); }

herr_t AddName(hid_t, const char *name, const H5L_info_t *, void *opdata)
{
  auto names = reinterpret_cast<std::vector<std::string> *>(opdata);
  names->push_back(name);
  return 0;
}

std::vector<std::string> List(Handle h)
{
  std::vector<std::string> names;
  H5Literate(h, H5_INDEX_NAME, H5_ITER_INC, NULL, AddName, &names);

  std::erase_if(names, [h](std::string const &name) {
    H5O_info_t info;
#if H5_VERSION_GE(1, 12, 0)
    H5Oget_info_by_name(h, name.c_str(), &info, H5O_INFO_BASIC, H5P_DEFAULT);
#else
    H5Oget_info_by_name2(h, name.c_str(), &info, H5O_INFO_BASIC, H5P_DEFAULT);
#endif
    return info.type != H5O_TYPE_DATASET;
  });

  return names;
}

} // namespace HD5
} // namespace sn
