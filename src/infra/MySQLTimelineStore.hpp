#pragma once
#include "core/TimelineStore.hpp"
#include <mysql/mysql.h>
#include <string>

class MySQLTimelineStore final : public TimelineStore {
public:
  MySQLTimelineStore(const std::string &uri, const std::string &user,
                     const std::string &pass, const std::string &schema);
  ~MySQLTimelineStore();

  MySQLTimelineStore(const MySQLTimelineStore &) = delete;
  MySQLTimelineStore &operator=(const MySQLTimelineStore &) = delete;

  void begin() override;
  void commit() override;
  void rollback() override;
  void upsert_segment(const Segment &segment) override;
  SegmentId max_segment_id() override;
  std::vector<Segment> query_segments_between(double from,
                                              double to) override;

private:
  MYSQL *conn_ = nullptr;
};
