// matrix_lang/runtime/stdlib/stdlib.cpp - Standard library installation
#include "stdlib_support.hpp"

namespace matrix_lang
{

void install_stdlib(BuiltinRegistry & registry)
{
  stdlib::install_math(registry);
  stdlib::install_io(registry);
  stdlib::install_array(registry);
  stdlib::install_vector(registry);
  stdlib::install_matrix(registry);
  stdlib::install_random(registry);
  stdlib::install_jit(registry);
}

}  // namespace matrix_lang
