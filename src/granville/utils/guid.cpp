
#include "guid.hpp"

#include <boost/uuid/nil_generator.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <algorithm>

namespace granville
{
Guid new_guid()
{
   // random_generator is not thread safe; one per thread.
   thread_local boost::uuids::random_generator generator;
   return generator();
}

Guid nil_guid() { return boost::uuids::nil_uuid(); }

std::string to_string(const Guid& guid) { return boost::uuids::to_string(guid); }

std::string to_compact_string(const Guid& guid)
{
   auto s = boost::uuids::to_string(guid);
   s.erase(std::remove(begin(s), end(s), '-'), end(s));
   return s;
}

} // namespace granville
