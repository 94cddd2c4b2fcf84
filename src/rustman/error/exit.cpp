#include "./exit.hpp"

#include <boost/leaf/error.hpp>
#include <boost/leaf/exception.hpp>

void rustman::throw_system_exit(int rc) {
    BOOST_LEAF_THROW_EXCEPTION(e_exit{rc});
}
