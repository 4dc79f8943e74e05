/* Tailor
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */


#include "tailor/util/builder.hpp"
#include "tailor/test/test_common_util.hpp"
#include "tailor/test/test_logger.hpp"
#include <boost/make_shared.hpp>
#include <gtest/gtest.h>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace tailor::util::test
{

namespace
{
using std::string;

/* A handle class: copies share one implementation object; setters are `const`.  Reference semantics via Builder.
 * The `id` defaults to 0. */
class Record_handle :
  public Builder<Record_handle>
{
public:
  Record_handle() :
    m_impl(boost::make_shared<Impl>())
  {
    // Nothing else.
  }

  int id() const
  {
    return m_impl->m_id;
  }

  void set_id(int id) const
  {
    m_impl->m_id = id;
  }

  const string& name() const
  {
    return m_impl->m_name;
  }

  void set_name(const string& name) const
  {
    m_impl->m_name = name;
  }

  bool same_object(const Record_handle& other) const
  {
    return m_impl == other.m_impl;
  }

private:
  struct Impl
  {
    int m_id = 0;
    string m_name;
  };

  boost::shared_ptr<Impl> m_impl;
}; // class Record_handle

// A plain value type.  Value semantics via Better_builder.
struct Record_value :
  public Better_builder<Record_value>
{
  int m_id = 0;
  string m_name;
};

// Subclass of a reference-semantics class; it adds shared state of its own.
class Titled_record_handle :
  public Record_handle
{
public:
  Titled_record_handle() :
    m_title(boost::make_shared<string>())
  {
    // Nothing else.
  }

  const string& title() const
  {
    return *m_title;
  }

  void set_title(const string& title) const
  {
    *m_title = title;
  }

private:
  boost::shared_ptr<string> m_title;
}; // class Titled_record_handle

// Subclass of a value-semantics class.
struct Extended_record_value :
  public Record_value
{
  int m_extra = 0;
};

// A value type that (wrongly) picked the reference-semantics mixin.  Mutating procedures must not compile for it.
struct Naive_record :
  public Builder<Naive_record>
{
  int m_id = 0;
};

// Move-only value type: configurable only as an rvalue receiver.
struct Move_only_record :
  public Better_builder<Move_only_record>
{
  std::unique_ptr<int> m_payload;
};

// Derives from both mixins: value semantics wins.
struct Dual_record :
  public Builder<Dual_record>,
  public Better_builder<Dual_record>
{
  int m_id = 0;
};

// Not ours to modify: opted in retroactively below.
struct Legacy_rect
{
  int m_width = 0;
  int m_height = 0;
};

// Counts copies, to check that the rvalue form of Better_builder::with() moves instead.
struct Copy_counting_record :
  public Better_builder<Copy_counting_record>
{
  Copy_counting_record() = default;
  Copy_counting_record(const Copy_counting_record& src) :
    Better_builder<Copy_counting_record>(src),
    m_copies(src.m_copies + 1)
  {
  }
  Copy_counting_record(Copy_counting_record&& src) = default;

  int m_copies = 0;
};

} // Anonymous namespace

} // namespace tailor::util::test

namespace tailor::util
{

template<>
class Builder_traits<test::Legacy_rect>
{
public:
  static constexpr Builder_semantics S_SEMANTICS = Builder_semantics::S_VALUE;
private:
  Builder_traits() = delete;
};

} // namespace tailor::util

namespace tailor::util::test
{

namespace
{

// Compile-time properties.  The type system rejects a mutating procedure on the reference-semantics form.

using Mutate_naive = void (*)(Naive_record&);
using Inspect_naive = void (*)(const Naive_record&);
using Mutate_value = void (*)(Record_value&);
using Inspect_handle = void (*)(const Record_handle&);
using Mutate_handle = void (*)(Record_handle&);

static_assert(Builder_traits<Record_handle>::S_SEMANTICS == Builder_semantics::S_REFERENCE);
static_assert(Builder_traits<Record_value>::S_SEMANTICS == Builder_semantics::S_VALUE);
static_assert(Builder_traits<Naive_record>::S_SEMANTICS == Builder_semantics::S_REFERENCE);
static_assert(Builder_traits<Dual_record>::S_SEMANTICS == Builder_semantics::S_VALUE);
static_assert(Builder_traits<Legacy_rect>::S_SEMANTICS == Builder_semantics::S_VALUE);
static_assert(Builder_traits<boost::shared_ptr<Legacy_rect>>::S_SEMANTICS == Builder_semantics::S_REFERENCE);
static_assert(Builder_traits<std::shared_ptr<Legacy_rect>>::S_SEMANTICS == Builder_semantics::S_REFERENCE);
static_assert(Builder_traits<int>::S_SEMANTICS == Builder_semantics::S_NONE);
static_assert(Builder_traits<string>::S_SEMANTICS == Builder_semantics::S_NONE);

static_assert(std::is_same_v<Builder_configured_ref<Record_value>, Record_value&>);
static_assert(std::is_same_v<Builder_configured_ref<Record_handle>, const Record_handle&>);

static_assert(!is_builder_configurable_v<Naive_record, Mutate_naive>,
              "A value type on the reference-semantics form must not accept a mutating procedure.");
static_assert(!std::is_invocable_v<Mutate_naive, const Naive_record&>);
static_assert(is_builder_configurable_v<Naive_record, Inspect_naive>);
static_assert(is_builder_configurable_v<Record_value, Mutate_value>);
static_assert(is_builder_configurable_v<Record_handle, Inspect_handle>);
static_assert(!is_builder_configurable_v<Record_handle, Mutate_handle>);
static_assert(!is_builder_configurable_v<int, void (*)(int&)>);
static_assert(!is_builder_configurable_v<std::shared_ptr<int>, void (*)(std::shared_ptr<int>&)>);
static_assert(is_builder_configurable_v<std::shared_ptr<int>, void (*)(const std::shared_ptr<int>&)>);

// Opt-in is inherited, and util::with() keeps the subclass type; the member form returns the mixin's `Value`.
static_assert(Builder_traits<Titled_record_handle>::S_SEMANTICS == Builder_semantics::S_REFERENCE);
static_assert(Builder_traits<Extended_record_value>::S_SEMANTICS == Builder_semantics::S_VALUE);
static_assert(std::is_same_v<Builder_configured_ref<Titled_record_handle>, const Titled_record_handle&>);
static_assert(std::is_same_v<Builder_configured_ref<Extended_record_value>, Extended_record_value&>);
static_assert(std::is_same_v<decltype(with(std::declval<const Titled_record_handle&>(),
                                           std::declval<void (*)(const Titled_record_handle&)>())),
                             Titled_record_handle>);
static_assert(std::is_same_v<decltype(with(std::declval<const Extended_record_value&>(),
                                           std::declval<void (*)(Extended_record_value&)>())),
                             Extended_record_value>);
static_assert(std::is_same_v<decltype(std::declval<const Titled_record_handle&>()
                                        .with(std::declval<void (*)(const Record_handle&)>())),
                             Record_handle>);

// A procedure taking its parameter by copy would configure only that copy: rejected.
const auto s_configure_copy = [](Record_value record) { record.m_id = 1; };
const auto s_configure_ref = [](Record_value& record) { record.m_id = 1; };
const auto s_configure_generic = [](auto& record) { record.m_id = 1; };

static_assert(is_configure_by_copy_v<decltype(s_configure_copy)>);
static_assert(is_configure_by_copy_v<void (*)(Record_value)>);
static_assert(is_configure_by_copy_v<void (*)(const Record_value)>);
static_assert(!is_configure_by_copy_v<decltype(s_configure_ref)>);
static_assert(!is_configure_by_copy_v<decltype(s_configure_generic)>);
static_assert(!is_configure_by_copy_v<Mutate_value>);
static_assert(!is_builder_configurable_v<Record_value, decltype(s_configure_copy)>);
static_assert(!is_builder_configurable_v<Naive_record, void (*)(Naive_record)>);
static_assert(!is_builder_configurable_v<Record_handle, void (*)(Record_handle)>);
static_assert(is_builder_configurable_v<Record_value, decltype(s_configure_ref)>);
static_assert(is_builder_configurable_v<Record_value, decltype(s_configure_generic)>);

} // Anonymous namespace

TEST(Builder, Reference_semantics_mutation_visible_through_original)
{
  const Record_handle original;

  const auto configured = original.with([](const Record_handle& record)
  {
    EXPECT_EQ(record.id(), 0);
    record.set_id(1);
  });

  EXPECT_EQ(configured.id(), 1);
  EXPECT_EQ(original.id(), 1);
  EXPECT_TRUE(configured.same_object(original));

  // Another holder of the same object observes it too.
  const auto alias = original;
  configured.with([](const Record_handle& record) { record.set_name("aliased"); });
  EXPECT_EQ(alias.name(), "aliased");
}

TEST(Builder, Reference_semantics_inline_construction)
{
  const auto record = Record_handle().with([](const Record_handle& record)
  {
    EXPECT_EQ(record.id(), 0);
    record.set_id(1);
  });
  EXPECT_EQ(record.id(), 1);
}

TEST(Builder, Reference_semantics_inspecting_value_type)
{
  // The reference-semantics form on a value type compiles only for procedures that do not mutate.
  Naive_record naive;
  naive.m_id = 7;
  int seen = 0;
  const auto result = naive.with([&](const Naive_record& record) { seen = record.m_id; });
  EXPECT_EQ(seen, 7);
  EXPECT_EQ(result.m_id, 7);
}

TEST(Better_builder, Value_semantics_copy_configured_original_untouched)
{
  const Record_value original;

  const auto configured = original.with([](Record_value& record)
  {
    EXPECT_EQ(record.m_id, 0);
    record.m_id = 1;
    record.m_name = "configured";
  });

  EXPECT_EQ(configured.m_id, 1);
  EXPECT_EQ(configured.m_name, "configured");
  EXPECT_EQ(original.m_id, 0);
  EXPECT_TRUE(original.m_name.empty());
  EXPECT_NE(&configured, &original);
}

TEST(Better_builder, Value_semantics_inline_construction)
{
  const auto record = Record_value().with([](Record_value& record)
  {
    EXPECT_EQ(record.m_id, 0);
    record.m_id = 1;
  });
  EXPECT_EQ(record.m_id, 1);
}

TEST(Better_builder, Rvalue_receiver_is_moved)
{
  const auto moved = Copy_counting_record().with([](Copy_counting_record&) {});
  EXPECT_EQ(moved.m_copies, 0);

  const Copy_counting_record lvalue;
  const auto copied = lvalue.with([](Copy_counting_record&) {});
  EXPECT_EQ(copied.m_copies, 1);

  const auto move_only = Move_only_record().with([](Move_only_record& record)
  {
    record.m_payload = std::make_unique<int>(5);
  });
  ASSERT_TRUE(move_only.m_payload);
  EXPECT_EQ(*move_only.m_payload, 5);
}

TEST(Better_builder, Handle_type_shares_configuration)
{
  // A handle type on the value-semantics form: the configured copy is another handle to the same object.
  class Shared_counter :
    public Better_builder<Shared_counter>
  {
  public:
    Shared_counter() : m_count(boost::make_shared<int>(0)) {}
    void increment() { ++(*m_count); }
    int count() const { return *m_count; }
  private:
    boost::shared_ptr<int> m_count;
  };

  const Shared_counter original;
  const auto configured = original.with([](Shared_counter& counter) { counter.increment(); });
  EXPECT_EQ(configured.count(), 1);
  EXPECT_EQ(original.count(), 1);
}

TEST(With, Free_function_value_semantics)
{
  const Record_value original;
  const auto configured = with(original, [](Record_value& record) { record.m_id = 1; });
  EXPECT_EQ(configured.m_id, 1);
  EXPECT_EQ(original.m_id, 0);

  const auto dual = with(Dual_record(), [](Dual_record& record) { record.m_id = 3; });
  EXPECT_EQ(dual.m_id, 3);
}

TEST(With, Free_function_reference_semantics)
{
  const Record_handle original;
  const auto configured = with(original, [](const Record_handle& record) { record.set_id(1); });
  EXPECT_EQ(original.id(), 1);
  EXPECT_TRUE(configured.same_object(original));
}

TEST(With, Subclass_keeps_its_type)
{
  const Titled_record_handle table;
  const Titled_record_handle configured = with(table, [](const Titled_record_handle& record)
  {
    record.set_id(1);
    record.set_title("Inbox");
  });
  EXPECT_TRUE(configured.same_object(table));
  EXPECT_EQ(table.id(), 1);
  EXPECT_EQ(table.title(), "Inbox");
  EXPECT_EQ(configured.title(), "Inbox");

  Extended_record_value original;
  original.m_extra = 5;
  const Extended_record_value extended = with(original, [](Extended_record_value& record)
  {
    record.m_id = 2;
    ++record.m_extra;
  });
  EXPECT_EQ(extended.m_id, 2);
  EXPECT_EQ(extended.m_extra, 6);
  EXPECT_EQ(original.m_id, 0);
  EXPECT_EQ(original.m_extra, 5);

  // The inherited member form configures the subclass object too, but hands back the base type.
  const Record_handle base = table.with([](const Record_handle& record) { record.set_id(3); });
  EXPECT_EQ(table.id(), 3);
  EXPECT_TRUE(base.same_object(table));
}

TEST(With, Retroactive_opt_in)
{
  const Legacy_rect original;
  const auto rect = with(original, [](Legacy_rect& rect)
  {
    rect.m_width = 640;
    rect.m_height = 480;
  });
  EXPECT_EQ(rect.m_width, 640);
  EXPECT_EQ(rect.m_height, 480);
  EXPECT_EQ(original.m_width, 0);
}

TEST(With, Shared_pointers)
{
  const auto boost_ptr = boost::make_shared<Legacy_rect>();
  const auto boost_result = with(boost_ptr, [](const boost::shared_ptr<Legacy_rect>& rect) { rect->m_width = 1; });
  EXPECT_EQ(boost_result, boost_ptr);
  EXPECT_EQ(boost_ptr->m_width, 1);

  const auto std_ptr = std::make_shared<Legacy_rect>();
  const auto std_result = with(std_ptr, [](const std::shared_ptr<Legacy_rect>& rect) { rect->m_height = 2; });
  EXPECT_EQ(std_result, std_ptr);
  EXPECT_EQ(std_ptr->m_height, 2);
}

TEST(With, No_op_configuration_keeps_all_fields)
{
  Record_value value;
  value.m_id = 42;
  value.m_name = "unchanged";
  const auto value_result = value.with([](Record_value&) {});
  EXPECT_EQ(value_result.m_id, 42);
  EXPECT_EQ(value_result.m_name, "unchanged");

  const Record_handle handle;
  handle.set_id(42);
  const auto handle_result = handle.with([](const Record_handle&) {});
  EXPECT_EQ(handle_result.id(), 42);
  EXPECT_TRUE(handle_result.same_object(handle));
}

TEST(With, Configure_invoked_exactly_once)
{
  int calls = 0;
  Record_value().with([&](Record_value&) { ++calls; });
  EXPECT_EQ(calls, 1);
  Record_handle().with([&](const Record_handle&) { ++calls; });
  EXPECT_EQ(calls, 2);
  with(Legacy_rect(), [&](Legacy_rect&) { ++calls; });
  EXPECT_EQ(calls, 3);

  // A procedure returning something is fine; the result is ignored.
  const auto configured = Record_value().with([&](Record_value& record) { record.m_id = 9; return ++calls; });
  EXPECT_EQ(calls, 4);
  EXPECT_EQ(configured.m_id, 9);
}

TEST(With, Exception_propagates_value_original_untouched)
{
  const Record_value original;
  EXPECT_THROW(original.with([](Record_value& record)
                             {
                               record.m_id = 1;
                               throw std::runtime_error("configuration failed");
                             }),
               std::runtime_error);
  EXPECT_EQ(original.m_id, 0);

  try
  {
    with(original, [](Record_value&) { throw std::invalid_argument("exact type"); });
    FAIL() << "Should have thrown.";
  }
  catch (const std::invalid_argument& exc)
  {
    EXPECT_STREQ(exc.what(), "exact type");
  }
}

TEST(With, Exception_propagates_reference_partial_mutation_kept)
{
  const Record_handle original;
  EXPECT_THROW(original.with([](const Record_handle& record)
                             {
                               record.set_id(1);
                               if (record.id() == 1)
                               {
                                 throw std::runtime_error("configuration failed");
                               }
                               record.set_name("never");
                             }),
               std::runtime_error);
  EXPECT_EQ(original.id(), 1);
  EXPECT_TRUE(original.name().empty());
}

TEST(With, Logged_traces_configuration)
{
  std::ostringstream os;
  tailor::test::Test_logger logger(log::Sev::S_TRACE, os);

  const auto record = with(&logger, Record_value(), [](Record_value& record) { record.m_id = 1; });
  EXPECT_EQ(record.m_id, 1);

  EXPECT_TRUE(tailor::test::check_output(os.str(),
                                         { "\\[trce\\]: .*TAILOR-UTIL: .*Configuring object of type "
                                             "\\[.*Record_value\\] \\(semantics \\[val\\]\\)",
                                           "Configured object of type \\[.*Record_value\\]" }))
    << "Output: [" << os.str() << "].";

  os.str("");
  const Record_handle handle;
  with(&logger, handle, [](const Record_handle& record) { record.set_id(2); });
  EXPECT_EQ(handle.id(), 2);
  EXPECT_TRUE(tailor::test::check_output(os.str(), { "\\(semantics \\[ref\\]\\)" })) << "Output: [" << os.str() << "].";
}

TEST(With, Logged_silent_when_filtered_or_no_logger)
{
  std::ostringstream os;
  tailor::test::Test_logger logger(log::Sev::S_INFO, os);

  const auto record = with(&logger, Record_value(), [](Record_value& record) { record.m_id = 1; });
  EXPECT_EQ(record.m_id, 1);
  EXPECT_TRUE(os.str().empty());

  // Per-component override lets it through.
  logger.get_config().configure_component_verbosity(log::Sev::S_TRACE, Tailor_log_component::S_UTIL);
  with(&logger, Record_value(), [](Record_value&) {});
  EXPECT_FALSE(os.str().empty());

  const auto unlogged = with(nullptr, Record_value(), [](Record_value& record) { record.m_id = 2; });
  EXPECT_EQ(unlogged.m_id, 2);
}

TEST(With, Logged_skips_after_message_on_throw)
{
  std::ostringstream os;
  tailor::test::Test_logger logger(log::Sev::S_TRACE, os);

  EXPECT_THROW(with(&logger, Record_value(), [](Record_value&) { throw std::runtime_error("nope"); }),
               std::runtime_error);
  EXPECT_TRUE(tailor::test::check_output(os.str(), { "Configuring object" }));
  EXPECT_FALSE(tailor::test::check_output(os.str(), { "Configured object" }));
}

TEST(With, Logged_to_console)
{
  tailor::test::Test_logger logger(log::Sev::S_TRACE);
  EXPECT_TRUE(tailor::test::check_output([&]()
                                         {
                                           with(&logger, Legacy_rect(), [](Legacy_rect& rect) { rect.m_width = 1; });
                                         },
                                         std::cout,
                                         { "Configured object of type \\[.*Legacy_rect\\] \\(semantics \\[val\\]\\)" },
                                         false));
}

} // namespace tailor::util::test
