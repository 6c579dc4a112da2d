#include <gtest/gtest.h>
#include <cloudconnect/cloudconnect.hpp>

using namespace cloudconnect;

// ===========================================================================
// Transition table
// ===========================================================================

TEST(LifecycleTest, StoppedTransitions) {
    EXPECT_EQ(next_state(ResourceState::Stopped, Transition::Start), ResourceState::Running);
    EXPECT_FALSE(next_state(ResourceState::Stopped, Transition::Stop).has_value());
    EXPECT_EQ(next_state(ResourceState::Stopped, Transition::Delete), ResourceState::Deleted);
}

TEST(LifecycleTest, RunningTransitions) {
    EXPECT_FALSE(next_state(ResourceState::Running, Transition::Start).has_value());
    EXPECT_EQ(next_state(ResourceState::Running, Transition::Stop), ResourceState::Stopped);
    EXPECT_FALSE(next_state(ResourceState::Running, Transition::Delete).has_value());
}

TEST(LifecycleTest, DeletedIsTerminal) {
    for (auto t : {Transition::Start, Transition::Stop, Transition::Delete}) {
        EXPECT_FALSE(next_state(ResourceState::Deleted, t).has_value())
            << "transition " << to_string(t);
    }
}

TEST(LifecycleTest, TableIsUsableAtCompileTime) {
    static_assert(next_state(ResourceState::Stopped, Transition::Start) == ResourceState::Running);
    static_assert(!next_state(ResourceState::Deleted, Transition::Start).has_value());
    SUCCEED();
}

// ===========================================================================
// Error messages
// ===========================================================================

TEST(LifecycleTest, InvalidTransitionMessages) {
    EXPECT_EQ(std::string(InvalidTransitionError("svc1", Transition::Start,
                                                 ResourceState::Running).what()),
              "Resource 'svc1' is already running.");
    EXPECT_EQ(std::string(InvalidTransitionError("svc1", Transition::Start,
                                                 ResourceState::Deleted).what()),
              "Resource 'svc1' is deleted and cannot be started.");
    EXPECT_EQ(std::string(InvalidTransitionError("svc1", Transition::Stop,
                                                 ResourceState::Stopped).what()),
              "Resource 'svc1' is already stopped.");
    EXPECT_EQ(std::string(InvalidTransitionError("svc1", Transition::Stop,
                                                 ResourceState::Deleted).what()),
              "Resource 'svc1' is deleted and cannot be stopped.");
    EXPECT_EQ(std::string(InvalidTransitionError("svc1", Transition::Delete,
                                                 ResourceState::Running).what()),
              "Cannot delete: Resource 'svc1' must be stopped first.");
    EXPECT_EQ(std::string(InvalidTransitionError("svc1", Transition::Delete,
                                                 ResourceState::Deleted).what()),
              "Resource 'svc1' is already deleted.");
}

TEST(LifecycleTest, InvalidTransitionCarriesContext) {
    InvalidTransitionError e("cache1", Transition::Stop, ResourceState::Deleted);
    EXPECT_EQ(e.resource_name(), "cache1");
    EXPECT_EQ(e.transition(), Transition::Stop);
    EXPECT_EQ(e.current_state(), ResourceState::Deleted);
    EXPECT_EQ(e.kind(), ErrorKind::InvalidTransition);
}

TEST(LifecycleTest, ErrorKindsOfEachException) {
    EXPECT_EQ(ValidationError("f", "bad").kind(), ErrorKind::Validation);
    EXPECT_EQ(DuplicateNameError("n").kind(), ErrorKind::DuplicateName);
    EXPECT_EQ(NotFoundError("n").kind(), ErrorKind::NotFound);
    EXPECT_EQ(UnknownTypeError("t").kind(), ErrorKind::UnknownType);
    EXPECT_EQ(DuplicateTypeError("t").kind(), ErrorKind::DuplicateType);
    EXPECT_STREQ(to_string(ErrorKind::NotFound), "NotFoundError");
}
