#if !defined(_RXCP_COMMON_H_INCLUDED_)
#define _RXCP_COMMON_H_INCLUDED_

#include "infra/infra.h"

#include "error.h"
#include "codec.h"
#include "path_spec.h"
#include "work.h"
#include "channel.h"
#include "message.h"
#include "agent.h"
#include "endpoint.h"
#include "capacity.h"
#include "transfer.h"
#include "verification.h"
#include "copy.h"
#include "program_options.h"


#endif  // !defined(_RXCP_COMMON_H_INCLUDED_)
