#include <assert.h>
#include <debug.h>
#include <stdlib.h>

// the CE libc routes failed asserts here; report the location on the debug console before aborting
extern "C" void __assert_fail_loc(const struct __assert_loc* loc) {
		dbg_printf("[hill assert] %s:%u in %s\n", loc->__file, (unsigned)loc->__line, loc->__function);
		dbg_printf("[hill assert] %s\n", loc->__assertion);
		abort();
}
