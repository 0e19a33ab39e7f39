#include "trellis/math/MatrixOps.hh"

namespace trellis::math {

// Template instantiations for the hot paths of both representations
template Matrix multiply<Matrix>(const Matrix&, const Matrix&);
template PackedMatrix multiply<PackedMatrix>(const PackedMatrix&, const PackedMatrix&);
template Result<Matrix> invert<Matrix>(const Matrix&);
template Result<PackedMatrix> invert<PackedMatrix>(const PackedMatrix&);

} // namespace trellis::math
