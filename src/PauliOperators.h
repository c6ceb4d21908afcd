#pragma once

#include "Logger.hpp"
#include "Pauli/Phase.hpp"
#include "Pauli/Pauli.hpp"
#include "Pauli/PauliError.hpp"
#include "Operators/SparseOperator.h"
#include "Operators/DenseOperator.h"
