#include <gtest/gtest.h>

#include "components/normalizer/interface_normalizer.hpp"

using netmapper::components::InterfaceNormalizer;

TEST(InterfaceNormalizer, LongAndShortSpellingsConverge) {
    InterfaceNormalizer normalizer;

    EXPECT_EQ(normalizer.normalize("GigabitEthernet1/0/1"), "Gi1/0/1");
    EXPECT_EQ(normalizer.normalize("Gi1/0/1"), "Gi1/0/1");
    EXPECT_EQ(normalizer.normalize("gig 1/0/1"), "Gi1/0/1");
    EXPECT_EQ(normalizer.normalize("Ethernet1/49"), "Eth1/49");
    EXPECT_EQ(normalizer.normalize("Eth1/49"), "Eth1/49");
    EXPECT_EQ(normalizer.normalize("Et1"), "Eth1");
    EXPECT_EQ(normalizer.normalize("TenGigabitEthernet1/1/1"), "Te1/1/1");
    EXPECT_EQ(normalizer.normalize("Te1/1/1"), "Te1/1/1");
    EXPECT_EQ(normalizer.normalize("TwentyFiveGigE1/0/3"), "Twe1/0/3");
    EXPECT_EQ(normalizer.normalize("FortyGigabitEthernet1/49"), "Fo1/49");
    EXPECT_EQ(normalizer.normalize("HundredGigE1/0/1"), "Hu1/0/1");
    EXPECT_EQ(normalizer.normalize("FastEthernet0/1"), "Fa0/1");
}

TEST(InterfaceNormalizer, LogicalInterfaces) {
    InterfaceNormalizer normalizer;

    EXPECT_EQ(normalizer.normalize("Port-channel10"), "Po10");
    EXPECT_EQ(normalizer.normalize("Po10"), "Po10");
    EXPECT_EQ(normalizer.normalize("Vlan100"), "Vl100");
    EXPECT_EQ(normalizer.normalize("Loopback0"), "Lo0");
    EXPECT_EQ(normalizer.normalize("Gi0/1.100"), "Gi0/1.100");
}

TEST(InterfaceNormalizer, ManagementPorts) {
    InterfaceNormalizer normalizer;

    EXPECT_EQ(normalizer.normalize("mgmt0"), "Ma0");
    EXPECT_EQ(normalizer.normalize("Management1"), "Ma1");
    EXPECT_EQ(normalizer.normalize("mgmt"), "Ma0");
    EXPECT_EQ(normalizer.normalize("Management1", false), "Management1");
    EXPECT_TRUE(normalizer.is_management_interface("mgmt0"));
    EXPECT_TRUE(normalizer.is_management_interface("Management1"));
    EXPECT_FALSE(normalizer.is_management_interface("Gi0/1"));
}

TEST(InterfaceNormalizer, LongForm) {
    InterfaceNormalizer normalizer;

    EXPECT_EQ(normalizer.normalize("Gi0/1", false), "GigabitEthernet0/1");
    EXPECT_EQ(normalizer.normalize("eth1/1", false), "Ethernet1/1");
    EXPECT_EQ(normalizer.normalize("po5", false), "Port-Channel5");
}

TEST(InterfaceNormalizer, HostnamePrefixIsDropped) {
    InterfaceNormalizer normalizer;

    EXPECT_EQ(normalizer.normalize("sw1-Gi0/1"), "Gi0/1");
    EXPECT_EQ(normalizer.normalize("leaf-a-Ethernet3"), "Eth3");
}

TEST(InterfaceNormalizer, UnknownNamesAreLowercasedOnly) {
    InterfaceNormalizer normalizer;

    EXPECT_EQ(normalizer.normalize("Serial0/0/0"), "serial0/0/0");
    EXPECT_EQ(normalizer.normalize("  0050.5600.0a0b "), "0050.5600.0a0b");
    EXPECT_EQ(normalizer.normalize(""), "");
}

TEST(InterfaceNormalizer, NonAsciiBytesAreKept) {
    InterfaceNormalizer normalizer;

    EXPECT_EQ(normalizer.normalize("Port-\xC9tage1"), "port-\xc9tage1");
}
