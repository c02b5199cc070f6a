// tests/tests.hpp
#pragma once

#include <doctest/doctest.h>
