#include <zephyr/logging/log.h>

LOG_MODULE_REGISTER(netprov_app, LOG_LEVEL_INF);
