#include "salon/core/Logging.hpp"

Q_LOGGING_CATEGORY(lcLedger, "salon.ledger")
Q_LOGGING_CATEGORY(lcBooking, "salon.booking")
Q_LOGGING_CATEGORY(lcSession, "salon.session")
Q_LOGGING_CATEGORY(lcConfig, "salon.config")
