#pragma once

#include "libctdi/export.hpp"
#include "libctdi/fwd.hpp"
#include "libctdi/location.hpp"
#include "libctdi/scope.hpp"
#include "libctdi/metadata.hpp"
#include "libctdi/token.hpp"
#include "libctdi/declaration.hpp"
#include "libctdi/descriptor.hpp"
#include "libctdi/exceptions.hpp"
#include "libctdi/resolver.hpp"
#include "libctdi/graph_builder.hpp"
#include "libctdi/compiler.hpp"
#include "libctdi/logging.hpp"
#include "libctdi/yaml_io.hpp"
#include "libctdi/config.hpp"
