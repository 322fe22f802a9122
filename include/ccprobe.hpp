#pragma once

#include "ccprobe/config.hpp"
#include "ccprobe/diagnostics.hpp"
#include "ccprobe/dispatch.hpp"
#include "ccprobe/format.hpp"
#include "ccprobe/instrument.hpp"
#include "ccprobe/matrix.hpp"
#include "ccprobe/outcome.hpp"
#include "ccprobe/project.hpp"
#include "ccprobe/remote.hpp"
#include "ccprobe/report.hpp"
#include "ccprobe/suite.hpp"
#include "ccprobe/toolchain.hpp"
#include "ccprobe/utils.hpp"
