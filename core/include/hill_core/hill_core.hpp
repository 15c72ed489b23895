#pragma once

#include "hill_core/alphabet.hpp"
#include "hill_core/arena.hpp"
#include "hill_core/cipher.hpp"
#include "hill_core/config.hpp"
#include "hill_core/error.hpp"
#include "hill_core/explanation.hpp"
#include "hill_core/keys.hpp"
#include "hill_core/latex.hpp"
#include "hill_core/matrix.hpp"
#include "hill_core/modular.hpp"
#include "hill_core/ops.hpp"
#include "hill_core/rational.hpp"
#include "hill_core/report.hpp"
#include "hill_core/row_reduction.hpp"
#include "hill_core/slab.hpp"
#include "hill_core/text.hpp"
