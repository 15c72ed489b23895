#include <debug.h>

#define main hill_test_cipher_main
#include "../tests/test_cipher.cpp"
#undef main

int main() {
		dbg_printf("[TSTCIPH] start\n");
		const int rc = hill_test_cipher_main();
		dbg_printf("[TSTCIPH] %s rc=%d\n", rc == 0 ? "PASS" : "FAIL", rc);
		return rc;
}
