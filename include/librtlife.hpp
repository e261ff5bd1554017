#pragma once

#include "librtlife/export.hpp"
#include "librtlife/fwd.hpp"
#include "librtlife/exceptions.hpp"
#include "librtlife/log.hpp"
#include "librtlife/type_traits.hpp"
#include "librtlife/cycle_guard.hpp"
#include "librtlife/registration.hpp"
#include "librtlife/lifestyle.hpp"
#include "librtlife/scope.hpp"
#include "librtlife/container.hpp"
