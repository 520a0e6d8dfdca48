//
// dc_common.hpp
// dlnacast
//
// Author: Lukas Zeller / luz@plan44.ch
// Copyright: 2012-2015 by plan44.ch/luz
//

#ifndef __dlnacast__common__
#define __dlnacast__common__

#include <list>
#include <vector>
#include <map>
#include <set>
#include <string>

#include <boost/intrusive_ptr.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/function.hpp>
#include <boost/bind.hpp>

#include "dcobj.hpp"
#include "logger.hpp"
#include "utils.hpp"
#include "error.hpp"
#include "timeutils.hpp"

#endif /* __dlnacast__common__ */
