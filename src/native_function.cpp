#include "kestrel/native_function.h"
#include "kestrel/value.h"

namespace kestrel {

Value SimpleLambdaFunction::call(NativeCallContext& ctx, std::vector<Value>& args) {
    return fn_(ctx, args);
}

} // namespace kestrel
