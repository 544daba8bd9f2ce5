#include <xrpl/beast/unit_test.h>

#include <cstdlib>
#include <iostream>

int
main()
{
    beast::unit_test::reporter r(std::cout);
    bool const failed = r.run_each(beast::unit_test::global_suites());
    return failed ? EXIT_FAILURE : EXIT_SUCCESS;
}
