#pragma once

#include "inverse_core/config.hpp"
#include "inverse_core/error.hpp"
#include "inverse_core/latex.hpp"
#include "inverse_core/matrix.hpp"
#include "inverse_core/op_log.hpp"
#include "inverse_core/ops.hpp"
#include "inverse_core/row_ops.hpp"
#include "inverse_core/working_matrix.hpp"
#include "inverse_core/writer.hpp"
