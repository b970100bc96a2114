#include "reflex/matcher.h"
#include "reflex/abslexer.h"

#include <algorithm>
#include <cassert>
#include <charconv>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <functional>
#include <initializer_list>
#include <fstream>
#include <iostream>
#include <list>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

using reflex::Input;

using std::cerr;
using std::chars_format;
using std::cout;
using std::errc;
using std::exception;
using std::from_chars;
using std::fstream;
using std::function;
using std::initializer_list;
using std::ios_base;
using std::list;
using std::make_unique;
using std::max;
using std::min;
using std::move;
using std::nullopt;
using std::optional;
using std::ostream;
using std::pair;
using std::string;
using std::stringstream;
using std::string_view;
using std::stoul;
using std::unique_ptr;
using std::unordered_map;
using std::unordered_set;
using std::vector;

namespace filesystem = std::filesystem;
