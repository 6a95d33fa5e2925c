#include "Module.h"

namespace pl {

Module::Module(const std::string &name)
    : loggerName_(name), logger_(logging::getLogger(name)) {}

} // namespace pl
